#pragma once

#include "ciforge/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ciforge {

enum class EventType : std::uint8_t { Push, PullRequest };
BOOST_DESCRIBE_ENUM(EventType, Push, PullRequest)
CIFORGE_DEFINE_ENUM_SERDE(EventType, EventType::Push)

/// Accepts `push`, `pull_request`, `pull-request`, `PullRequest` and `pr`.
[[nodiscard]] inline auto parse_event_alias(std::string_view text)
    -> std::optional<EventType> {
  if (util::normalize_enum_token(text) == "pr") {
    return EventType::PullRequest;
  }
  return try_parse<EventType>(text);
}

/// A normalized repository event. Produced only by intake::normalize, so
/// every field is non-empty and the branch carries no `refs/heads/` prefix.
struct TriggerEvent {
  std::string repository;
  std::string branch;
  std::string commit_sha;
  EventType event_type{EventType::Push};

  auto operator==(const TriggerEvent &) const -> bool = default;
};

} // namespace ciforge
