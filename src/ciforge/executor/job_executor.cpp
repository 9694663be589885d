#include "ciforge/executor/job_executor.hpp"

#include "ciforge/executor/executor_utils.hpp"
#include "ciforge/executor/step_process.hpp"
#include "ciforge/util/log.hpp"

#include <chrono>
#include <filesystem>

namespace ciforge {

namespace {

[[nodiscard]] auto step_status_of(const StepProcessResult &r) -> StepStatus {
  if (r.timed_out) {
    return StepStatus::TimedOut;
  }
  if (r.cancelled) {
    return StepStatus::Cancelled;
  }
  return r.exit_code == 0 && !r.spawn_failed ? StepStatus::Succeeded
                                             : StepStatus::Failed;
}

[[nodiscard]] auto resolve_working_dir(const StepDefinition &step,
                                       const RunnerLease &lease)
    -> std::string {
  if (step.working_dir.empty()) {
    return lease.workspace().string();
  }
  std::filesystem::path dir{step.working_dir};
  if (dir.is_relative() && !lease.workspace().empty()) {
    return (lease.workspace() / dir).string();
  }
  return dir.string();
}

auto finish(JobExecution &exec, JobStatus status, FailureReason reason)
    -> void {
  exec.status = status;
  exec.reason = reason;
  exec.finished_at = std::chrono::system_clock::now();
}

} // namespace

auto JobExecutor::step_environment(const JobSpec &spec,
                                   const StepDefinition &step,
                                   const RunnerId &runner) -> EnvMap {
  const auto &job = spec.job_definition();
  EnvMap env = spec.definition->env;
  for (const auto &[k, v] : job.env) {
    env.insert_or_assign(k, v);
  }
  for (const auto &[k, v] : step.env) {
    env.insert_or_assign(k, v);
  }
  env.insert_or_assign("CI", "true");
  env.insert_or_assign("CIFORGE_RUN_ID", spec.run_id.str());
  env.insert_or_assign("CIFORGE_PIPELINE", spec.definition->name);
  env.insert_or_assign("CIFORGE_REPOSITORY", spec.event.repository);
  env.insert_or_assign("CIFORGE_BRANCH", spec.event.branch);
  env.insert_or_assign("CIFORGE_COMMIT_SHA", spec.event.commit_sha);
  env.insert_or_assign("CIFORGE_EVENT",
                       std::string(to_string_view(spec.event.event_type)));
  env.insert_or_assign("CIFORGE_JOB", job.name);
  env.insert_or_assign("CIFORGE_STEP", step.name);
  env.insert_or_assign("CIFORGE_RUNNER", runner.str());
  return env;
}

auto JobExecutor::execute(const JobSpec &spec, const RunnerLease &lease,
                          CancellationToken token,
                          JobProgressHandler on_progress)
    -> task<JobExecution> {
  const auto &job = spec.job_definition();
  const auto &pipeline = spec.definition->name;
  auto notify = [&](const JobExecution &exec) {
    if (on_progress) {
      on_progress(exec);
    }
  };

  JobExecution exec{.job_name = job.name,
                    .status = JobStatus::Running,
                    .runner = lease.id(),
                    .attempts = spec.attempt,
                    .started_at = std::chrono::system_clock::now()};
  const auto deadline = std::chrono::steady_clock::now() + job.timeout;
  log::info("run {} job '{}' starting on {} (attempt {}, {} step(s))",
            spec.run_id, job.name, lease.id(), spec.attempt, job.steps.size());
  notify(exec);

  for (const auto &step : job.steps) {
    if (token.is_cancelled()) {
      finish(exec, JobStatus::Cancelled, FailureReason::Cancelled);
      break;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      finish(exec, JobStatus::Failed, FailureReason::Timeout);
      break;
    }

    reporter_.step_started(spec.run_id, pipeline, job.name, step.name);
    log::debug("run {} job '{}' step '{}': {}", spec.run_id, job.name,
               step.name, cmd_preview(step.run));

    StepCommand cmd{.type = step.type,
                    .command = step.run,
                    .working_dir = resolve_working_dir(step, lease),
                    .env = step_environment(spec, step, lease.id()),
                    .max_output_bytes = options_.max_step_output_bytes};
    auto outcome = co_await run_step_process(
        std::move(cmd), deadline, token,
        [&](OutputStream stream, std::string_view data) {
          reporter_.publish_output(OutputChunk{.run_id = spec.run_id,
                                               .job = job.name,
                                               .step = step.name,
                                               .stream = stream,
                                               .data = std::string(data)});
        });

    StepResult result{.name = step.name,
                      .status = step_status_of(outcome),
                      .exit_code = outcome.exit_code,
                      .output = std::move(outcome.output),
                      .output_truncated = outcome.output_truncated,
                      .duration = outcome.duration,
                      .error = std::move(outcome.error)};
    const auto status = result.status;
    exec.steps.push_back(std::move(result));
    reporter_.step_finished(spec.run_id, pipeline, job.name,
                            exec.steps.back());

    if (outcome.spawn_failed) {
      finish(exec, JobStatus::Failed, FailureReason::InfrastructureError);
    } else if (status == StepStatus::TimedOut) {
      finish(exec, JobStatus::Failed, FailureReason::Timeout);
    } else if (status == StepStatus::Cancelled) {
      finish(exec, JobStatus::Cancelled, FailureReason::Cancelled);
    } else if (status == StepStatus::Failed) {
      finish(exec, JobStatus::Failed, FailureReason::StepFailure);
    }
    if (exec.is_terminal()) {
      break;
    }
    notify(exec);
  }

  if (!exec.is_terminal()) {
    finish(exec, JobStatus::Succeeded, FailureReason::None);
  }
  log::info("run {} job '{}' finished: {} ({})", spec.run_id, job.name,
            to_string_view(exec.status), to_string_view(exec.reason));
  co_return exec;
}

} // namespace ciforge
