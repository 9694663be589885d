#include "ciforge/status/status_reporter.hpp"

#include "ciforge/status/status_json.hpp"
#include "ciforge/util/log.hpp"

#include <string>

namespace ciforge {

auto StatusReporter::add_sink(std::shared_ptr<IStatusSink> sink) -> void {
  if (sink) {
    sinks_.push_back(std::move(sink));
  }
}

auto StatusReporter::publish(const StatusUpdate &update) -> void {
  for (const auto &sink : sinks_) {
    try {
      sink->on_status(update);
    } catch (const std::exception &e) {
      log::error("Status sink failed on {} update for run {}: {}",
                 to_string_view(update.scope), update.run_id, e.what());
    }
  }
}

auto StatusReporter::publish_output(const OutputChunk &chunk) -> void {
  for (const auto &sink : sinks_) {
    try {
      sink->on_output(chunk);
    } catch (const std::exception &e) {
      log::error("Status sink failed on output for run {}: {}", chunk.run_id,
                 e.what());
    }
  }
}

auto StatusReporter::run_changed(const Run &run) -> void {
  publish(StatusUpdate{
      .run_id = run.id(),
      .pipeline = run.pipeline_name(),
      .scope = StatusScope::Run,
      .status = std::string(to_string_view(run.status())),
      .timestamp = std::chrono::system_clock::now(),
      .reason = run.is_terminal() ? std::optional{run.reason()} : std::nullopt,
  });
}

auto StatusReporter::job_changed(const Run &run, const JobExecution &job)
    -> void {
  publish(StatusUpdate{
      .run_id = run.id(),
      .pipeline = run.pipeline_name(),
      .scope = StatusScope::Job,
      .status = std::string(to_string_view(job.status)),
      .timestamp = std::chrono::system_clock::now(),
      .job = job.job_name,
      .reason = job.is_terminal() ? std::optional{job.reason} : std::nullopt,
  });
}

auto StatusReporter::step_started(const RunId &run_id,
                                  std::string_view pipeline,
                                  std::string_view job, std::string_view step)
    -> void {
  publish(StatusUpdate{
      .run_id = run_id,
      .pipeline = std::string(pipeline),
      .scope = StatusScope::Step,
      .status = "running",
      .timestamp = std::chrono::system_clock::now(),
      .job = std::string(job),
      .step = std::string(step),
  });
}

auto StatusReporter::step_finished(const RunId &run_id,
                                   std::string_view pipeline,
                                   std::string_view job,
                                   const StepResult &result) -> void {
  publish(StatusUpdate{
      .run_id = run_id,
      .pipeline = std::string(pipeline),
      .scope = StatusScope::Step,
      .status = std::string(to_string_view(result.status)),
      .timestamp = std::chrono::system_clock::now(),
      .job = std::string(job),
      .step = result.name,
      .exit_code = result.exit_code,
  });
}

auto LogStatusSink::on_status(const StatusUpdate &update) -> void {
  const auto reason =
      update.reason && *update.reason != FailureReason::None
          ? std::string(" (") + std::string(to_string_view(*update.reason)) + ")"
          : std::string{};
  switch (update.scope) {
  case StatusScope::Run:
    log::info("run {} [{}] -> {}{}", update.run_id, update.pipeline,
              update.status, reason);
    break;
  case StatusScope::Job:
    log::info("run {} job '{}' -> {}{}", update.run_id, update.job.value_or(""),
              update.status, reason);
    break;
  case StatusScope::Step:
    if (update.exit_code) {
      log::info("run {} job '{}' step '{}' -> {} (exit {})", update.run_id,
                update.job.value_or(""), update.step.value_or(""),
                update.status, *update.exit_code);
    } else {
      log::debug("run {} job '{}' step '{}' -> {}", update.run_id,
                 update.job.value_or(""), update.step.value_or(""),
                 update.status);
    }
    break;
  }
}

auto LogStatusSink::on_output(const OutputChunk &chunk) -> void {
  if (!log_output_) {
    return;
  }
  std::string_view data = chunk.data;
  while (!data.empty()) {
    const auto nl = data.find('\n');
    const auto line = data.substr(0, nl);
    if (!line.empty()) {
      log::info("[{}/{}] {}", chunk.job, chunk.step, line);
    }
    if (nl == std::string_view::npos) {
      break;
    }
    data.remove_prefix(nl + 1);
  }
}

auto JsonLinesStatusSink::open(const std::filesystem::path &path)
    -> Result<std::shared_ptr<JsonLinesStatusSink>> {
  FILE *f = std::fopen(path.c_str(), "a");
  if (!f) {
    log::error("Cannot open status file {}", path.string());
    return fail(Error::FileNotFound);
  }
  std::unique_ptr<FILE, decltype(&std::fclose)> guard{f, &std::fclose};
  std::setvbuf(f, nullptr, _IOLBF, 0);
  auto sink = std::make_shared<JsonLinesStatusSink>(OpenTag{}, f);
  guard.release();
  return ok(std::move(sink));
}

JsonLinesStatusSink::~JsonLinesStatusSink() {
  if (file_) {
    std::fclose(file_);
  }
}

auto JsonLinesStatusSink::on_status(const StatusUpdate &update) -> void {
  write_line(dump_json(to_json(update)));
}

auto JsonLinesStatusSink::on_output(const OutputChunk &chunk) -> void {
  write_line(dump_json(to_json(chunk)));
}

auto JsonLinesStatusSink::write_line(std::string_view line) -> void {
  std::scoped_lock lock(mu_);
  std::fwrite(line.data(), 1, line.size(), file_);
  std::fputc('\n', file_);
}

} // namespace ciforge
