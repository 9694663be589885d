#pragma once

#include "ciforge/core/error.hpp"
#include "ciforge/intake/event.hpp"
#include "ciforge/pipeline/pipeline_definition.hpp"
#include "ciforge/util/enum.hpp"
#include "ciforge/util/id.hpp"

#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ciforge {

enum class RunStatus : std::uint8_t {
  Queued,
  Running,
  Succeeded,
  Failed,
  Cancelled,
};
BOOST_DESCRIBE_ENUM(RunStatus, Queued, Running, Succeeded, Failed, Cancelled)
CIFORGE_DEFINE_ENUM_SERDE(RunStatus, RunStatus::Queued)

enum class JobStatus : std::uint8_t {
  Pending,
  Running,
  Succeeded,
  Failed,
  Cancelled,
  Skipped,
};
BOOST_DESCRIBE_ENUM(JobStatus, Pending, Running, Succeeded, Failed, Cancelled,
                    Skipped)
CIFORGE_DEFINE_ENUM_SERDE(JobStatus, JobStatus::Pending)

enum class StepStatus : std::uint8_t { Succeeded, Failed, TimedOut, Cancelled };
BOOST_DESCRIBE_ENUM(StepStatus, Succeeded, Failed, TimedOut, Cancelled)
CIFORGE_DEFINE_ENUM_SERDE(StepStatus, StepStatus::Failed)

enum class FailureReason : std::uint8_t {
  None,
  StepFailure,
  Timeout,
  Cancelled,
  Superseded,
  InfrastructureError,
  UpstreamFailed,
  ShuttingDown,
};
BOOST_DESCRIBE_ENUM(FailureReason, None, StepFailure, Timeout, Cancelled,
                    Superseded, InfrastructureError, UpstreamFailed,
                    ShuttingDown)
CIFORGE_DEFINE_ENUM_SERDE(FailureReason, FailureReason::None)

[[nodiscard]] constexpr auto is_terminal(RunStatus s) noexcept -> bool {
  return s == RunStatus::Succeeded || s == RunStatus::Failed ||
         s == RunStatus::Cancelled;
}

[[nodiscard]] constexpr auto is_terminal(JobStatus s) noexcept -> bool {
  return s != JobStatus::Pending && s != JobStatus::Running;
}

struct StepResult {
  std::string name;
  StepStatus status{StepStatus::Failed};
  int exit_code{-1};
  std::string output; // interleaved stdout/stderr, bounded
  bool output_truncated{false};
  std::chrono::milliseconds duration{0};
  std::string error; // spawn or signal detail, empty on a clean exit
};

struct JobExecution {
  std::string job_name;
  JobStatus status{JobStatus::Pending};
  FailureReason reason{FailureReason::None};
  std::vector<StepResult> steps;
  RunnerId runner;
  int attempts{0};
  std::chrono::system_clock::time_point started_at{};
  std::chrono::system_clock::time_point finished_at{};

  [[nodiscard]] auto is_terminal() const noexcept -> bool {
    return ::ciforge::is_terminal(status);
  }
};

struct RunSummary {
  RunId id;
  std::string pipeline;
  TriggerEvent event;
  RunStatus status{RunStatus::Queued};
  FailureReason reason{FailureReason::None};
  std::chrono::system_clock::time_point created_at{};
  std::chrono::system_clock::time_point finished_at{};
};

/// One execution of a pipeline for one event. Copyable so observers can take
/// snapshots; the live instance is owned and mutated by the Scheduler.
class Run {
public:
  Run(RunId id, std::shared_ptr<const PipelineDefinition> definition,
      TriggerEvent event, const std::vector<JobIndex> &admitted_jobs);

  [[nodiscard]] auto id() const noexcept -> const RunId & { return id_; }
  [[nodiscard]] auto pipeline_name() const -> const std::string & {
    return definition_->name;
  }
  [[nodiscard]] auto definition() const noexcept
      -> const std::shared_ptr<const PipelineDefinition> & {
    return definition_;
  }
  [[nodiscard]] auto event() const noexcept -> const TriggerEvent & {
    return event_;
  }
  [[nodiscard]] auto status() const noexcept -> RunStatus { return status_; }
  [[nodiscard]] auto reason() const noexcept -> FailureReason {
    return reason_;
  }
  [[nodiscard]] auto is_terminal() const noexcept -> bool {
    return ::ciforge::is_terminal(status_);
  }
  [[nodiscard]] auto cancel_requested() const noexcept -> bool {
    return cancel_reason_.has_value();
  }
  [[nodiscard]] auto cancel_reason() const noexcept
      -> std::optional<FailureReason> {
    return cancel_reason_;
  }
  [[nodiscard]] auto created_at() const noexcept {
    return created_at_;
  }
  [[nodiscard]] auto started_at() const noexcept {
    return started_at_;
  }
  [[nodiscard]] auto finished_at() const noexcept {
    return finished_at_;
  }

  [[nodiscard]] auto jobs() const noexcept -> const std::vector<JobExecution> & {
    return jobs_;
  }
  /// Position of `job_name` in jobs(), if the job was admitted.
  [[nodiscard]] auto job_slot(std::string_view job_name) const
      -> std::optional<std::size_t>;
  [[nodiscard]] auto find_job(std::string_view job_name) const
      -> const JobExecution *;
  /// Pipeline job index of the job in slot `slot`.
  [[nodiscard]] auto job_index(std::size_t slot) const -> JobIndex {
    return job_indices_.at(slot);
  }

  [[nodiscard]] auto summary() const -> RunSummary;

  // Transitions. Each returns InvalidState when it would move a terminal
  // entity or otherwise break the lifecycle.
  auto mark_running() -> Result<void>;
  auto mark_job_running(std::size_t slot, const RunnerId &runner)
      -> Result<void>;
  /// Replaces the non-terminal record in `slot` with a progress or final
  /// record produced by the executor.
  auto update_job(std::size_t slot, JobExecution execution) -> Result<void>;
  auto skip_job(std::size_t slot) -> Result<void>;
  /// Records the request and cancels every job that has not started.
  /// Running jobs are left to the executor.
  auto request_cancel(FailureReason reason) -> void;

  /// Moves the run to its terminal status once every job is terminal.
  /// Returns true on the call that performed the transition.
  auto try_finalize() -> bool;

private:
  RunId id_;
  std::shared_ptr<const PipelineDefinition> definition_;
  TriggerEvent event_;
  RunStatus status_{RunStatus::Queued};
  FailureReason reason_{FailureReason::None};
  std::optional<FailureReason> cancel_reason_;
  std::vector<JobExecution> jobs_;
  std::vector<JobIndex> job_indices_;
  std::chrono::system_clock::time_point created_at_;
  std::chrono::system_clock::time_point started_at_{};
  std::chrono::system_clock::time_point finished_at_{};
};

} // namespace ciforge
