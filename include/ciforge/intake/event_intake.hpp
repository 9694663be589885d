#pragma once

#include "ciforge/core/coroutine.hpp"
#include "ciforge/core/error.hpp"
#include "ciforge/intake/event.hpp"
#include "ciforge/util/id.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace ciforge {
class DefinitionStore;
class Scheduler;
} // namespace ciforge

namespace ciforge::intake {

/// An event as it arrives from outside, before any checking.
struct RawEvent {
  std::string repository;
  std::string branch;
  std::string commit_sha;
  std::string event_type;
};

/// Trims every field, strips `refs/heads/` from the branch, resolves event
/// aliases and lower-cases the commit SHA. Fails with InvalidArgument when a
/// field is empty, the event type is unknown or the SHA is not 7-40 hex
/// characters. `diagnostic`, when given, names the offending field.
[[nodiscard]] auto normalize(const RawEvent &raw,
                             std::string *diagnostic = nullptr)
    -> Result<TriggerEvent>;

/// Accepts snake_case (`commit_sha`, `event_type`) and camelCase
/// (`commitSHA`, `eventType`) keys. Unknown keys are ignored.
[[nodiscard]] auto parse_event_json(std::string_view text) -> Result<RawEvent>;

[[nodiscard]] auto is_valid_commit_sha(std::string_view sha) noexcept -> bool;

/// Result of submitting one event to one pipeline.
struct IntakeOutcome {
  std::string pipeline;
  std::optional<RunId> run_id;
  std::error_code error;

  [[nodiscard]] auto accepted() const noexcept -> bool {
    return run_id.has_value();
  }
};

/// Routes normalized events to every pipeline whose trigger filter matches.
class EventIntake {
public:
  EventIntake(DefinitionStore &store, Scheduler &scheduler)
      : store_(store), scheduler_(scheduler) {}

  /// Normalizes `raw` and submits one run per matching definition. Fails
  /// with InvalidArgument for a malformed event and NoMatchingPipeline when
  /// no definition's trigger filter matches; per-pipeline rejections are
  /// reported in the outcomes.
  [[nodiscard]] auto ingest(const RawEvent &raw)
      -> Result<std::vector<IntakeOutcome>>;
  [[nodiscard]] auto ingest(const TriggerEvent &event)
      -> Result<std::vector<IntakeOutcome>>;

  [[nodiscard]] auto async_ingest(TriggerEvent event)
      -> task<Result<std::vector<IntakeOutcome>>>;

private:
  DefinitionStore &store_;
  Scheduler &scheduler_;
};

} // namespace ciforge::intake
