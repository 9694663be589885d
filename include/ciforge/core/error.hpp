#pragma once

#include <array>
#include <cerrno>
#include <concepts>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace ciforge {

enum class Error : std::uint8_t {
  Success,
  DefinitionInvalid,
  ParseError,
  ValidationError,
  ConcurrencyExceeded,
  StepFailure,
  Timeout,
  Cancelled,
  InfrastructureError,
  NotFound,
  InvalidArgument,
  InvalidState,
  FileNotFound,
  ShuttingDown,
  NoMatchingPipeline,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::array<std::string_view, 16> messages = {
      "success",
      "pipeline definition is invalid",
      "parse error",
      "validation error",
      "branch concurrency limit exceeded",
      "step failed",
      "timeout",
      "cancelled",
      "infrastructure error",
      "not found",
      "invalid argument",
      "invalid state transition",
      "file not found",
      "scheduler is shutting down",
      "no pipeline matched the event",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "ciforge";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      return "unrecognized ciforge error";
    }
    return std::string{messages.at(idx)};
  }
};

inline auto error_category() -> const ErrorCategory & {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T>
concept ResultValue = std::destructible<T> || std::is_void_v<T>;

template <typename T> using Result = std::expected<T, std::error_code>;

template <typename T>
  requires ResultValue<std::decay_t<T>>
[[nodiscard]] constexpr auto ok(T &&value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> { return {}; }

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

} // namespace ciforge

template <> struct std::is_error_code_enum<ciforge::Error> : std::true_type {};
