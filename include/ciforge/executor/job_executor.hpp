#pragma once

#include "ciforge/core/cancellation.hpp"
#include "ciforge/core/coroutine.hpp"
#include "ciforge/pipeline/pipeline_definition.hpp"
#include "ciforge/run/run.hpp"
#include "ciforge/scheduler/runner_pool.hpp"
#include "ciforge/status/status_reporter.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace ciforge {

/// Everything needed to execute one admitted job of one run.
struct JobSpec {
  RunId run_id;
  std::shared_ptr<const PipelineDefinition> definition;
  JobIndex job{kInvalidJob};
  TriggerEvent event;
  int attempt{1};

  [[nodiscard]] auto job_definition() const -> const JobDefinition & {
    return definition->jobs.at(job);
  }
};

struct JobExecutorOptions {
  std::size_t max_step_output_bytes{1024 * 1024};
};

/// Called with the job record after every change, so observers can follow a
/// job while it runs.
using JobProgressHandler = std::move_only_function<void(const JobExecution &)>;

/// Runs the steps of a job in order on a leased runner.
///
/// The first step that does not succeed ends the job. The job timeout is
/// one wall-clock budget for all steps; when it runs out the in-flight step
/// is killed, recorded as TimedOut and the job fails with reason `timeout`.
/// A fired token kills the in-flight step and the job becomes Cancelled.
/// A step that cannot be spawned fails the job with `infrastructure_error`.
class JobExecutor {
public:
  JobExecutor(StatusReporter &reporter, JobExecutorOptions options = {})
      : reporter_(reporter), options_(options) {}

  [[nodiscard]] auto execute(const JobSpec &spec, const RunnerLease &lease,
                             CancellationToken token,
                             JobProgressHandler on_progress = {})
      -> task<JobExecution>;

  /// Full step environment: pipeline, job and step env in that order,
  /// then the CIFORGE_* run variables.
  [[nodiscard]] static auto step_environment(const JobSpec &spec,
                                             const StepDefinition &step,
                                             const RunnerId &runner) -> EnvMap;

private:
  StatusReporter &reporter_;
  JobExecutorOptions options_;
};

} // namespace ciforge
