#pragma once

#include "ciforge/config/system_config.hpp"
#include "ciforge/core/cancellation.hpp"
#include "ciforge/core/coroutine.hpp"
#include "ciforge/core/error.hpp"
#include "ciforge/core/runtime.hpp"
#include "ciforge/executor/job_executor.hpp"
#include "ciforge/pipeline/pipeline_definition.hpp"
#include "ciforge/run/run.hpp"
#include "ciforge/scheduler/runner_pool.hpp"
#include "ciforge/status/status_reporter.hpp"

#include <ankerl/unordered_dense.h>

#include <chrono>
#include <deque>
#include <future>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace ciforge {

struct SchedulerOptions {
  int max_concurrent_runs{4};
  int max_runs_per_branch{2};
  std::size_t retention{200};
  int infra_max_retries{2};
  std::chrono::milliseconds infra_retry_backoff{1000};
  std::chrono::milliseconds runner_acquire_timeout{std::chrono::minutes{10}};
  RunnerPoolOptions runners;
  JobExecutorOptions executor;

  [[nodiscard]] static auto from_config(const SystemConfig &cfg)
      -> SchedulerOptions;
};

/// Admits runs, drives their jobs and owns every Run.
///
/// All state lives on one strand of the runtime. The synchronous members
/// block the caller until the strand has handled the request and must not
/// be called from a runtime thread; coroutines use the async_ variants.
class Scheduler {
public:
  Scheduler(Runtime &runtime, StatusReporter &reporter,
            SchedulerOptions options);
  ~Scheduler();

  Scheduler(const Scheduler &) = delete;
  auto operator=(const Scheduler &) -> Scheduler & = delete;

  /// Parses `raw_definition` first; a definition that does not load fails
  /// with DefinitionInvalid.
  [[nodiscard]] auto submit(const TriggerEvent &event,
                            std::string_view raw_definition) -> Result<RunId>;
  [[nodiscard]] auto submit(const TriggerEvent &event,
                            std::shared_ptr<const PipelineDefinition> definition)
      -> Result<RunId>;
  [[nodiscard]] auto cancel(const RunId &id) -> Result<void>;
  [[nodiscard]] auto snapshot(const RunId &id) -> Result<Run>;
  [[nodiscard]] auto list_runs() -> std::vector<RunSummary>;
  /// Blocks until the run is terminal; Timeout if it is not within
  /// `timeout`.
  [[nodiscard]] auto wait(const RunId &id, std::chrono::milliseconds timeout)
      -> Result<Run>;
  /// Cancels every non-terminal run and rejects further submissions with
  /// ShuttingDown. Returns once all runs are terminal or `timeout` passed.
  auto shutdown(std::chrono::milliseconds timeout = std::chrono::seconds{30})
      -> void;

  [[nodiscard]] auto async_submit(
      TriggerEvent event, std::shared_ptr<const PipelineDefinition> definition)
      -> task<Result<RunId>>;
  [[nodiscard]] auto async_cancel(RunId id) -> task<Result<void>>;
  [[nodiscard]] auto async_snapshot(RunId id) -> task<Result<Run>>;
  [[nodiscard]] auto async_list_runs() -> task<std::vector<RunSummary>>;

  [[nodiscard]] auto options() const noexcept -> const SchedulerOptions & {
    return options_;
  }

private:
  struct RunState {
    explicit RunState(Run r) : run(std::move(r)) {}
    Run run;
    CancellationSource cancel;
    std::string branch_key;
    std::vector<char> launched;
    int active_jobs{0};
    bool holds_slot{false}; // counted in running_count_
    std::vector<std::shared_ptr<std::promise<Run>>> waiters;
  };
  using RunStatePtr = std::shared_ptr<RunState>;

  // Strand-confined implementation.
  auto do_submit(const TriggerEvent &event,
                 std::shared_ptr<const PipelineDefinition> definition)
      -> Result<RunId>;
  auto do_cancel(const RunId &id, FailureReason reason) -> Result<void>;
  auto supersede(const TriggerEvent &event, const std::string &key) -> void;
  auto admit_queued() -> void;
  auto start_run(const RunStatePtr &state) -> void;
  auto launch_ready_jobs(const RunStatePtr &state) -> void;
  auto run_job(RunStatePtr state, std::size_t slot) -> task<void>;
  auto attempt_job(RunStatePtr state, std::size_t slot, JobSpec spec)
      -> task<JobExecution>;
  auto finish_run(const RunStatePtr &state) -> void;
  auto evict_finished() -> void;
  [[nodiscard]] auto count_active_on_branch(const std::string &key) const
      -> int;

  [[nodiscard]] auto can_block() const -> bool;
  template <typename F> auto on_strand(F fn) -> std::invoke_result_t<F &>;
  template <typename F>
  auto on_strand_async(F fn) -> task<std::invoke_result_t<F &>>;

  Runtime &runtime_;
  StatusReporter &reporter_;
  SchedulerOptions options_;
  Strand strand_;
  RunnerPool pool_;
  JobExecutor executor_;

  ankerl::unordered_dense::map<RunId, RunStatePtr> runs_;
  std::deque<RunId> queue_;
  std::deque<RunId> finished_;
  int running_count_{0};
  bool shutting_down_{false};
};

} // namespace ciforge
