#include "ciforge/scheduler/scheduler.hpp"

#include "ciforge/core/asio_awaitable.hpp"
#include "ciforge/pipeline/definition_loader.hpp"
#include "ciforge/util/log.hpp"

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_future.hpp>

#include <algorithm>
#include <format>

namespace ciforge {

namespace {

[[nodiscard]] auto branch_key_of(const TriggerEvent &event) -> std::string {
  return std::format("{}#{}", event.repository, event.branch);
}

[[nodiscard]] auto retry_delay(std::chrono::milliseconds base, int attempt)
    -> std::chrono::milliseconds {
  return base * (1LL << std::min(attempt - 1, 10));
}

} // namespace

auto SchedulerOptions::from_config(const SystemConfig &cfg)
    -> SchedulerOptions {
  SchedulerOptions opts;
  opts.max_concurrent_runs = cfg.scheduler.max_concurrent_runs;
  opts.max_runs_per_branch = cfg.scheduler.max_runs_per_branch;
  opts.retention =
      static_cast<std::size_t>(std::max(1, cfg.scheduler.retention));
  opts.infra_max_retries = cfg.scheduler.infra_max_retries;
  opts.infra_retry_backoff = cfg.scheduler.infra_retry_backoff;
  opts.runner_acquire_timeout =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          cfg.scheduler.runner_acquire_timeout);
  opts.runners.runner_count = cfg.runners.count;
  opts.runners.workspace_root = cfg.runners.workspace_root;
  opts.executor.max_step_output_bytes = cfg.status.max_step_output_bytes;
  return opts;
}

Scheduler::Scheduler(Runtime &runtime, StatusReporter &reporter,
                     SchedulerOptions options)
    : runtime_(runtime), reporter_(reporter), options_(std::move(options)),
      strand_(runtime.make_strand()), pool_(strand_, options_.runners),
      executor_(reporter, options_.executor) {}

Scheduler::~Scheduler() {
  if (can_block()) {
    shutdown(std::chrono::seconds{5});
  }
}

auto Scheduler::can_block() const -> bool {
  return runtime_.is_running() && !runtime_.in_runtime_thread();
}

template <typename F>
auto Scheduler::on_strand(F fn) -> std::invoke_result_t<F &> {
  using R = std::invoke_result_t<F &>;
  return co_spawn(
             strand_,
             [fn = std::move(fn)]() mutable -> task<R> { co_return fn(); },
             boost::asio::use_future)
      .get();
}

template <typename F>
auto Scheduler::on_strand_async(F fn) -> task<std::invoke_result_t<F &>> {
  using R = std::invoke_result_t<F &>;
  co_return co_await co_spawn(
      strand_, [fn = std::move(fn)]() mutable -> task<R> { co_return fn(); },
      use_awaitable);
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

auto Scheduler::submit(const TriggerEvent &event,
                       std::string_view raw_definition) -> Result<RunId> {
  std::string diagnostic;
  auto definition = DefinitionLoader::load_shared(raw_definition, &diagnostic);
  if (!definition) {
    log::warn("Rejected submission for {}@{}: {}", event.repository,
              event.branch, diagnostic.empty() ? definition.error().message()
                                               : diagnostic);
    return fail(Error::DefinitionInvalid);
  }
  return submit(event, std::move(*definition));
}

auto Scheduler::submit(const TriggerEvent &event,
                       std::shared_ptr<const PipelineDefinition> definition)
    -> Result<RunId> {
  if (!can_block()) {
    return fail(Error::InvalidState);
  }
  return on_strand([this, event, definition = std::move(definition)] {
    return do_submit(event, definition);
  });
}

auto Scheduler::cancel(const RunId &id) -> Result<void> {
  if (!can_block()) {
    return fail(Error::InvalidState);
  }
  return on_strand([this, id] { return do_cancel(id, FailureReason::Cancelled); });
}

auto Scheduler::snapshot(const RunId &id) -> Result<Run> {
  if (!can_block()) {
    return fail(Error::InvalidState);
  }
  return on_strand([this, id]() -> Result<Run> {
    auto it = runs_.find(id);
    if (it == runs_.end()) {
      return fail(Error::NotFound);
    }
    return it->second->run;
  });
}

auto Scheduler::list_runs() -> std::vector<RunSummary> {
  if (!can_block()) {
    return {};
  }
  return on_strand([this] {
    std::vector<RunSummary> out;
    out.reserve(runs_.size());
    for (const auto &[id, state] : runs_) {
      out.push_back(state->run.summary());
    }
    std::ranges::sort(out, {}, &RunSummary::id);
    return out;
  });
}

auto Scheduler::wait(const RunId &id, std::chrono::milliseconds timeout)
    -> Result<Run> {
  if (!can_block()) {
    return fail(Error::InvalidState);
  }
  auto registered =
      on_strand([this, id]() -> Result<std::future<Run>> {
        auto it = runs_.find(id);
        if (it == runs_.end()) {
          return fail(Error::NotFound);
        }
        auto promise = std::make_shared<std::promise<Run>>();
        auto future = promise->get_future();
        if (it->second->run.is_terminal()) {
          promise->set_value(it->second->run);
        } else {
          it->second->waiters.push_back(std::move(promise));
        }
        return future;
      });
  if (!registered) {
    return fail(registered.error());
  }
  if (registered->wait_for(timeout) == std::future_status::timeout) {
    return fail(Error::Timeout);
  }
  return registered->get();
}

auto Scheduler::shutdown(std::chrono::milliseconds timeout) -> void {
  if (!can_block()) {
    return;
  }
  auto pending = on_strand([this] {
    std::vector<std::future<Run>> futures;
    if (!shutting_down_) {
      log::info("Scheduler shutting down, cancelling active runs");
    }
    shutting_down_ = true;
    std::vector<RunId> active;
    for (const auto &[id, state] : runs_) {
      if (!state->run.is_terminal()) {
        active.push_back(id);
      }
    }
    for (const auto &id : active) {
      auto it = runs_.find(id);
      if (it == runs_.end()) {
        continue;
      }
      auto state = it->second;
      if (state->run.is_terminal()) {
        continue;
      }
      auto promise = std::make_shared<std::promise<Run>>();
      futures.push_back(promise->get_future());
      state->waiters.push_back(std::move(promise));
      if (auto r = do_cancel(id, FailureReason::ShuttingDown); !r) {
        log::warn("Failed to cancel run {} during shutdown: {}", id,
                  r.error().message());
      }
    }
    return futures;
  });

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  for (auto &f : pending) {
    if (f.wait_until(deadline) == std::future_status::timeout) {
      log::warn("Scheduler shutdown timed out with runs still active");
      return;
    }
  }
}

auto Scheduler::async_submit(
    TriggerEvent event, std::shared_ptr<const PipelineDefinition> definition)
    -> task<Result<RunId>> {
  co_return co_await on_strand_async(
      [this, event = std::move(event), definition = std::move(definition)] {
        return do_submit(event, definition);
      });
}

auto Scheduler::async_cancel(RunId id) -> task<Result<void>> {
  co_return co_await on_strand_async([this, id = std::move(id)] {
    return do_cancel(id, FailureReason::Cancelled);
  });
}

auto Scheduler::async_snapshot(RunId id) -> task<Result<Run>> {
  co_return co_await on_strand_async(
      [this, id = std::move(id)]() -> Result<Run> {
        auto it = runs_.find(id);
        if (it == runs_.end()) {
          return fail(Error::NotFound);
        }
        return it->second->run;
      });
}

auto Scheduler::async_list_runs() -> task<std::vector<RunSummary>> {
  co_return co_await on_strand_async([this] {
    std::vector<RunSummary> out;
    out.reserve(runs_.size());
    for (const auto &[id, state] : runs_) {
      out.push_back(state->run.summary());
    }
    std::ranges::sort(out, {}, &RunSummary::id);
    return out;
  });
}

// ---------------------------------------------------------------------------
// Strand-confined implementation
// ---------------------------------------------------------------------------

auto Scheduler::do_submit(const TriggerEvent &event,
                          std::shared_ptr<const PipelineDefinition> definition)
    -> Result<RunId> {
  if (shutting_down_) {
    return fail(Error::ShuttingDown);
  }
  if (!definition) {
    return fail(Error::InvalidArgument);
  }
  auto admitted = definition->admitted_jobs(event.branch);
  if (admitted.empty()) {
    log::info("Pipeline '{}' has no job for branch '{}'", definition->name,
              event.branch);
    return fail(Error::NoMatchingPipeline);
  }

  auto key = branch_key_of(event);
  if (event.event_type == EventType::Push) {
    supersede(event, key);
  }
  if (count_active_on_branch(key) >= options_.max_runs_per_branch) {
    log::warn("Rejected run of '{}' for {}: {} active runs on branch",
              definition->name, key, options_.max_runs_per_branch);
    return fail(Error::ConcurrencyExceeded);
  }

  auto id = generate_run_id();
  auto state = std::make_shared<RunState>(
      Run{id, std::move(definition), event, admitted});
  state->branch_key = std::move(key);
  state->launched.assign(state->run.jobs().size(), 0);
  runs_.emplace(id, state);
  queue_.push_back(id);

  log::info("Run {} of '{}' queued for {}@{} ({})", id,
            state->run.pipeline_name(), event.repository, event.branch,
            event.commit_sha);
  reporter_.run_changed(state->run);
  admit_queued();
  return id;
}

auto Scheduler::do_cancel(const RunId &id, FailureReason reason)
    -> Result<void> {
  auto it = runs_.find(id);
  if (it == runs_.end()) {
    return fail(Error::NotFound);
  }
  auto state = it->second;
  auto &run = state->run;
  if (run.is_terminal() || run.cancel_requested()) {
    return ok();
  }

  log::info("Cancelling run {} ({})", id, to_string_view(reason));
  std::vector<char> was_pending(run.jobs().size(), 0);
  for (std::size_t i = 0; i < run.jobs().size(); ++i) {
    was_pending[i] = run.jobs()[i].status == JobStatus::Pending;
  }
  run.request_cancel(reason);
  for (std::size_t i = 0; i < run.jobs().size(); ++i) {
    if (was_pending[i] && run.jobs()[i].is_terminal()) {
      reporter_.job_changed(run, run.jobs()[i]);
    }
  }
  state->cancel.cancel();

  if (run.status() == RunStatus::Queued) {
    std::erase(queue_, id);
  }
  if (state->active_jobs == 0 && run.try_finalize()) {
    finish_run(state);
  }
  return ok();
}

auto Scheduler::supersede(const TriggerEvent &event, const std::string &key)
    -> void {
  // Runs fanned out from the same push (one per matching pipeline) share a
  // commit and are not superseded by each other.
  std::vector<RunId> older;
  for (const auto &[id, state] : runs_) {
    if (state->branch_key == key && !state->run.is_terminal() &&
        !state->run.cancel_requested() &&
        state->run.event().commit_sha != event.commit_sha) {
      older.push_back(id);
    }
  }
  for (const auto &id : older) {
    log::info("Run {} superseded by push of {} to {}", id, event.commit_sha,
              key);
    if (auto r = do_cancel(id, FailureReason::Superseded); !r) {
      log::warn("Failed to supersede run {}: {}", id, r.error().message());
    }
  }
}

auto Scheduler::count_active_on_branch(const std::string &key) const -> int {
  int count = 0;
  for (const auto &[id, state] : runs_) {
    if (state->branch_key == key && !state->run.is_terminal() &&
        !state->run.cancel_requested()) {
      ++count;
    }
  }
  return count;
}

auto Scheduler::admit_queued() -> void {
  while (running_count_ < options_.max_concurrent_runs && !queue_.empty()) {
    auto id = std::move(queue_.front());
    queue_.pop_front();
    auto it = runs_.find(id);
    if (it == runs_.end() || it->second->run.is_terminal()) {
      continue;
    }
    start_run(it->second);
  }
}

auto Scheduler::start_run(const RunStatePtr &state) -> void {
  if (auto r = state->run.mark_running(); !r) {
    log::error("Run {} could not start: {}", state->run.id(),
               r.error().message());
    return;
  }
  state->holds_slot = true;
  ++running_count_;
  log::info("Run {} started ({} jobs)", state->run.id(),
            state->run.jobs().size());
  reporter_.run_changed(state->run);
  launch_ready_jobs(state);
}

auto Scheduler::launch_ready_jobs(const RunStatePtr &state) -> void {
  auto &run = state->run;
  const auto &def = *run.definition();

  auto slot_of = [&](JobIndex idx) -> std::optional<std::size_t> {
    return run.job_slot(def.jobs.at(idx).name);
  };

  bool progress = true;
  while (progress && !run.is_terminal()) {
    progress = false;
    for (std::size_t slot = 0; slot < run.jobs().size(); ++slot) {
      if (state->launched[slot] ||
          run.jobs()[slot].status != JobStatus::Pending) {
        continue;
      }
      bool deps_done = true;
      bool deps_ok = true;
      for (JobIndex dep : def.graph.deps(run.job_index(slot))) {
        auto dep_slot = slot_of(dep);
        if (!dep_slot) {
          deps_ok = false;
          continue;
        }
        const auto &dj = run.jobs()[*dep_slot];
        if (!dj.is_terminal()) {
          deps_done = false;
        } else if (dj.status != JobStatus::Succeeded) {
          deps_ok = false;
        }
      }
      if (!deps_done) {
        continue;
      }
      if (!deps_ok) {
        if (run.skip_job(slot)) {
          log::info("Run {}: job '{}' skipped, upstream did not succeed",
                    run.id(), run.jobs()[slot].job_name);
          reporter_.job_changed(run, run.jobs()[slot]);
          progress = true;
        }
        continue;
      }
      if (run.cancel_requested()) {
        continue;
      }
      state->launched[slot] = 1;
      ++state->active_jobs;
      runtime_.spawn_on(strand_, run_job(state, slot));
    }
  }

  if (state->active_jobs == 0 && run.try_finalize()) {
    finish_run(state);
  }
}

auto Scheduler::attempt_job(RunStatePtr state, std::size_t slot, JobSpec spec)
    -> task<JobExecution> {
  auto &run = state->run;
  auto token = state->cancel.token();

  JobExecution failed{.job_name = run.jobs()[slot].job_name,
                      .attempts = spec.attempt};

  auto lease = co_await pool_.acquire(token, options_.runner_acquire_timeout);
  if (!lease) {
    failed.finished_at = std::chrono::system_clock::now();
    if (lease.error() == make_error_code(Error::Cancelled)) {
      failed.status = JobStatus::Cancelled;
      failed.reason = FailureReason::Cancelled;
    } else {
      log::warn("Run {}: no runner for job '{}' within {}ms", run.id(),
                failed.job_name, options_.runner_acquire_timeout.count());
      failed.status = JobStatus::Failed;
      failed.reason = FailureReason::InfrastructureError;
    }
    co_return failed;
  }

  if (auto r = run.mark_job_running(slot, lease->id()); !r) {
    // Cancelled while waiting for the runner.
    failed.status = JobStatus::Cancelled;
    failed.reason = FailureReason::Cancelled;
    failed.finished_at = std::chrono::system_clock::now();
    co_return failed;
  }
  reporter_.job_changed(run, run.jobs()[slot]);

  auto exec = co_await executor_.execute(
      spec, *lease, token, [state, slot](const JobExecution &progress) {
        if (auto r = state->run.update_job(slot, progress); !r) {
          log::debug("Run {}: progress for finished job ignored",
                     state->run.id());
        }
      });
  exec.attempts = spec.attempt;
  co_return exec;
}

auto Scheduler::run_job(RunStatePtr state, std::size_t slot) -> task<void> {
  auto &run = state->run;
  auto token = state->cancel.token();
  JobSpec spec{.run_id = run.id(),
               .definition = run.definition(),
               .job = run.job_index(slot),
               .event = run.event()};

  JobExecution exec;
  for (int attempt = 1;; ++attempt) {
    spec.attempt = attempt;
    exec = co_await attempt_job(state, slot, spec);
    if (exec.reason != FailureReason::InfrastructureError ||
        attempt > options_.infra_max_retries || token.is_cancelled()) {
      break;
    }
    const auto delay = retry_delay(options_.infra_retry_backoff, attempt);
    log::warn("Run {}: job '{}' hit an infrastructure error, retrying in "
              "{}ms (attempt {}/{})",
              run.id(), exec.job_name, delay.count(), attempt + 1,
              options_.infra_max_retries + 1);
    boost::asio::steady_timer timer(strand_, delay);
    auto registration = token.on_cancel([&timer] { timer.cancel(); });
    co_await timer.async_wait(use_nothrow);
    if (token.is_cancelled()) {
      exec.status = JobStatus::Cancelled;
      exec.reason = FailureReason::Cancelled;
      break;
    }
  }

  if (exec.status == JobStatus::Cancelled) {
    exec.reason = run.cancel_reason().value_or(FailureReason::Cancelled);
  }
  if (!run.jobs()[slot].is_terminal()) {
    if (auto r = run.update_job(slot, std::move(exec)); !r) {
      log::error("Run {}: could not record job result: {}", run.id(),
                 r.error().message());
    } else {
      const auto &job = run.jobs()[slot];
      log::info("Run {}: job '{}' {} ({})", run.id(), job.job_name,
                to_string_view(job.status), to_string_view(job.reason));
      reporter_.job_changed(run, job);
    }
  }

  --state->active_jobs;
  launch_ready_jobs(state);
}

auto Scheduler::finish_run(const RunStatePtr &state) -> void {
  auto &run = state->run;
  if (state->holds_slot) {
    state->holds_slot = false;
    --running_count_;
  }
  std::erase(queue_, run.id());
  log::info("Run {} of '{}' finished: {} ({})", run.id(), run.pipeline_name(),
            to_string_view(run.status()), to_string_view(run.reason()));
  reporter_.run_changed(run);

  for (auto &waiter : state->waiters) {
    waiter->set_value(run);
  }
  state->waiters.clear();

  finished_.push_back(run.id());
  evict_finished();
  admit_queued();
}

auto Scheduler::evict_finished() -> void {
  while (finished_.size() > options_.retention) {
    runs_.erase(finished_.front());
    finished_.pop_front();
  }
}

} // namespace ciforge
