#pragma once

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <functional>
#include <iterator>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <unistd.h>
#include <utility>

namespace ciforge::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error, Off };

inline constexpr std::array<std::string_view, 6> level_names = {
    "trace", "debug", "info", "warn", "error", "off"};

inline constexpr std::array<std::string_view, 6> level_colors = {
    "\o{33}[90m", // trace: gray
    "\o{33}[36m", // debug: cyan
    "\o{33}[32m", // info: green
    "\o{33}[33m", // warn: yellow
    "\o{33}[31m", // error: red
    "",
};

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] inline auto level_color(Level level) -> std::string_view {
  return level_colors.at(std::to_underlying(level));
}

[[nodiscard]] inline auto parse_level(std::string_view name,
                                      Level fallback = Level::Info) -> Level {
  const auto *it = std::ranges::find(level_names, name);
  if (it == level_names.end()) {
    return fallback;
  }
  return static_cast<Level>(std::distance(level_names.begin(), it));
}

// Lines are formatted on the calling thread and written under one lock, so
// output from runtime threads never interleaves mid-line.
class Logger {
  std::atomic<Level> level_{Level::Info};
  std::mutex mu_;
  FILE *out_{stdout};
  FILE *file_{nullptr};
  bool color_{true};

  [[nodiscard]] static auto is_terminal(FILE *f) noexcept -> bool {
    const int fd = ::fileno(f);
    return fd >= 0 && ::isatty(fd) != 0;
  }

public:
  Logger() : color_(is_terminal(stdout)) {}
  ~Logger() {
    if (file_) {
      std::fclose(file_);
    }
  }

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  auto set_output_stderr() -> void {
    std::scoped_lock lock(mu_);
    out_ = stderr;
    color_ = is_terminal(stderr);
  }

  auto set_output_file(std::string_view path) -> bool {
    std::scoped_lock lock(mu_);
    if (path.empty()) {
      if (file_) {
        std::fclose(file_);
        file_ = nullptr;
      }
      out_ = stdout;
      color_ = is_terminal(stdout);
      return true;
    }
    FILE *f = std::fopen(std::string(path).c_str(), "a");
    if (!f) {
      return false;
    }
    std::setvbuf(f, nullptr, _IOLBF, 0);
    if (file_) {
      std::fclose(file_);
    }
    file_ = f;
    out_ = f;
    color_ = false;
    return true;
  }

  auto flush() -> void {
    std::scoped_lock lock(mu_);
    std::fflush(out_);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (level < level_.load(std::memory_order_acquire) || level == Level::Off)
      return;

    const auto time = std::chrono::floor<std::chrono::seconds>(
        std::chrono::system_clock::now());
    const auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    const auto body = std::format(fmt, std::forward<Args>(args)...);

    std::scoped_lock lock(mu_);
    std::string line;
    line.reserve(body.size() + 48);
    if (color_) {
      std::format_to(std::back_inserter(line),
                     "[{:%Y-%m-%d %H:%M:%S}] [{}{}\o{33}[0m] [{}] {}\n", time,
                     level_color(level), level_name(level), tid, body);
    } else {
      std::format_to(std::back_inserter(line),
                     "[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] {}\n", time,
                     level_name(level), tid, body);
    }
    std::fwrite(line.data(), 1, line.size(), out_);
    if (level >= Level::Warn) {
      std::fflush(out_);
    }
  }
};

inline Logger &logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

inline auto set_output_stderr() -> void { logger().set_output_stderr(); }

inline auto flush() -> void { logger().flush(); }

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

} // namespace ciforge::log
