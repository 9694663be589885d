#include "ciforge/run/run.hpp"

#include <algorithm>

namespace ciforge {

Run::Run(RunId id, std::shared_ptr<const PipelineDefinition> definition,
         TriggerEvent event, const std::vector<JobIndex> &admitted_jobs)
    : id_(std::move(id)), definition_(std::move(definition)),
      event_(std::move(event)), job_indices_(admitted_jobs),
      created_at_(std::chrono::system_clock::now()) {
  jobs_.reserve(admitted_jobs.size());
  for (JobIndex idx : admitted_jobs) {
    jobs_.push_back(JobExecution{.job_name = definition_->jobs.at(idx).name});
  }
}

auto Run::job_slot(std::string_view job_name) const
    -> std::optional<std::size_t> {
  auto it = std::ranges::find(jobs_, job_name, &JobExecution::job_name);
  if (it == jobs_.end()) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(it - jobs_.begin());
}

auto Run::find_job(std::string_view job_name) const -> const JobExecution * {
  auto slot = job_slot(job_name);
  return slot ? &jobs_[*slot] : nullptr;
}

auto Run::summary() const -> RunSummary {
  return RunSummary{.id = id_,
                    .pipeline = definition_->name,
                    .event = event_,
                    .status = status_,
                    .reason = reason_,
                    .created_at = created_at_,
                    .finished_at = finished_at_};
}

auto Run::mark_running() -> Result<void> {
  if (status_ != RunStatus::Queued) {
    return fail(Error::InvalidState);
  }
  status_ = RunStatus::Running;
  started_at_ = std::chrono::system_clock::now();
  return ok();
}

auto Run::mark_job_running(std::size_t slot, const RunnerId &runner)
    -> Result<void> {
  if (slot >= jobs_.size() || jobs_[slot].is_terminal()) {
    return fail(Error::InvalidState);
  }
  auto &job = jobs_[slot];
  job.status = JobStatus::Running;
  job.runner = runner;
  if (job.started_at == std::chrono::system_clock::time_point{}) {
    job.started_at = std::chrono::system_clock::now();
  }
  return ok();
}

auto Run::update_job(std::size_t slot, JobExecution execution)
    -> Result<void> {
  if (slot >= jobs_.size() || jobs_[slot].is_terminal() ||
      execution.job_name != jobs_[slot].job_name) {
    return fail(Error::InvalidState);
  }
  jobs_[slot] = std::move(execution);
  return ok();
}

auto Run::skip_job(std::size_t slot) -> Result<void> {
  if (slot >= jobs_.size() || jobs_[slot].status != JobStatus::Pending) {
    return fail(Error::InvalidState);
  }
  auto &job = jobs_[slot];
  job.status = JobStatus::Skipped;
  job.reason = FailureReason::UpstreamFailed;
  job.finished_at = std::chrono::system_clock::now();
  return ok();
}

auto Run::request_cancel(FailureReason reason) -> void {
  if (is_terminal() || cancel_reason_) {
    return;
  }
  cancel_reason_ = reason;
  const auto now = std::chrono::system_clock::now();
  for (auto &job : jobs_) {
    if (job.status == JobStatus::Pending) {
      job.status = JobStatus::Cancelled;
      job.reason = reason;
      job.finished_at = now;
    }
  }
}

auto Run::try_finalize() -> bool {
  if (is_terminal()) {
    return false;
  }
  if (!std::ranges::all_of(jobs_, &JobExecution::is_terminal)) {
    return false;
  }

  if (cancel_reason_) {
    status_ = RunStatus::Cancelled;
    reason_ = *cancel_reason_;
  } else if (auto failed = std::ranges::find(jobs_, JobStatus::Failed,
                                             &JobExecution::status);
             failed != jobs_.end()) {
    status_ = RunStatus::Failed;
    reason_ = failed->reason;
  } else if (std::ranges::any_of(jobs_, [](const JobExecution &job) {
               return job.status != JobStatus::Succeeded;
             })) {
    status_ = RunStatus::Cancelled;
    reason_ = FailureReason::Cancelled;
  } else {
    status_ = RunStatus::Succeeded;
    reason_ = FailureReason::None;
  }
  finished_at_ = std::chrono::system_clock::now();
  return true;
}

} // namespace ciforge
