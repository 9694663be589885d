#pragma once

#include <compare>
#include <cstddef>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace ciforge {

struct RunTag {};
struct RunnerTag {};

// Phantom-typed string id; a RunId cannot be passed where a RunnerId is
// expected.
template <typename Tag> class TypedId {
public:
  TypedId() = default;
  explicit TypedId(std::string value) : value_(std::move(value)) {}
  explicit TypedId(std::string_view value) : value_(value) {}
  explicit TypedId(const char *value) : value_(value ? value : "") {}

  [[nodiscard]] auto value() const noexcept -> std::string_view {
    return value_;
  }
  [[nodiscard]] auto str() const noexcept -> const std::string & {
    return value_;
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return value_.empty(); }

  [[nodiscard]] friend auto operator<=>(const TypedId &lhs,
                                        const TypedId &rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId &lhs, const TypedId &rhs)
      -> bool = default;

  [[nodiscard]] friend auto operator==(const TypedId &lhs,
                                       std::string_view rhs) noexcept -> bool {
    return lhs.value_ == rhs;
  }

private:
  std::string value_;
};

using RunId = TypedId<RunTag>;
using RunnerId = TypedId<RunnerTag>;

template <typename Tag>
inline auto operator<<(std::ostream &os, const TypedId<Tag> &id)
    -> std::ostream & {
  return os << id.value();
}

namespace detail {
[[nodiscard]] auto generate_uuid_v7_like() -> std::string;
} // namespace detail

/// Time-ordered run id: ids created later sort later.
[[nodiscard]] inline auto generate_run_id() -> RunId {
  return RunId{detail::generate_uuid_v7_like()};
}

[[nodiscard]] inline auto make_runner_id(std::size_t index) -> RunnerId {
  return RunnerId{std::format("runner-{}", index)};
}

} // namespace ciforge

// `is_avalanching` makes ankerl::unordered_dense::hash delegate to this
// specialization instead of hashing the object bytes.
template <typename Tag> struct std::hash<ciforge::TypedId<Tag>> {
  using is_avalanching = void;
  auto operator()(const ciforge::TypedId<Tag> &id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<ciforge::TypedId<Tag>>
    : std::formatter<std::string_view> {
  auto format(const ciforge::TypedId<Tag> &id, auto &ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
