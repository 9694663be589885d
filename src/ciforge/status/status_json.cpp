#include "ciforge/status/status_json.hpp"

#include "ciforge/util/time.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace ciforge {
namespace {

auto event_json(const TriggerEvent &event) -> JsonValue {
  return JsonValue{
      {"repository", event.repository},
      {"branch", event.branch},
      {"commit_sha", event.commit_sha},
      {"event_type", std::string(to_string_view(event.event_type))},
  };
}

auto step_json(const StepResult &step, bool include_output) -> JsonValue {
  JsonValue obj{
      {"name", step.name},
      {"status", std::string(to_string_view(step.status))},
      {"exit_code", static_cast<std::int64_t>(step.exit_code)},
      {"duration_ms", static_cast<std::int64_t>(step.duration.count())},
      {"output_truncated", step.output_truncated},
  };
  if (include_output) {
    obj.get_object().emplace("output", step.output);
  }
  if (!step.error.empty()) {
    obj.get_object().emplace("error", step.error);
  }
  return obj;
}

auto job_json(const JobExecution &job, bool include_output) -> JsonValue {
  JsonValue steps = std::vector<JsonValue>{};
  for (const auto &step : job.steps) {
    steps.get_array().emplace_back(step_json(step, include_output));
  }
  JsonValue obj{
      {"name", job.job_name},
      {"status", std::string(to_string_view(job.status))},
      {"reason", std::string(to_string_view(job.reason))},
      {"runner", job.runner.str()},
      {"attempts", static_cast<std::int64_t>(job.attempts)},
      {"started_at", util::format_iso8601(job.started_at)},
      {"finished_at", util::format_iso8601(job.finished_at)},
      {"steps", std::move(steps)},
  };
  return obj;
}

} // namespace

auto to_json(const StatusUpdate &update) -> JsonValue {
  JsonValue obj{
      {"type", "status"},
      {"run_id", update.run_id.str()},
      {"pipeline", update.pipeline},
      {"scope", std::string(to_string_view(update.scope))},
      {"status", update.status},
      {"timestamp", util::format_iso8601(update.timestamp)},
  };
  auto &fields = obj.get_object();
  if (update.job) {
    fields.emplace("job", *update.job);
  }
  if (update.step) {
    fields.emplace("step", *update.step);
  }
  if (update.reason && *update.reason != FailureReason::None) {
    fields.emplace("reason", std::string(to_string_view(*update.reason)));
  }
  if (update.exit_code) {
    fields.emplace("exit_code", static_cast<std::int64_t>(*update.exit_code));
  }
  return obj;
}

auto to_json(const OutputChunk &chunk) -> JsonValue {
  return JsonValue{
      {"type", "output"},
      {"run_id", chunk.run_id.str()},
      {"job", chunk.job},
      {"step", chunk.step},
      {"stream", std::string(to_string_view(chunk.stream))},
      {"data", chunk.data},
  };
}

auto to_json(const RunSummary &summary) -> JsonValue {
  return JsonValue{
      {"id", summary.id.str()},
      {"pipeline", summary.pipeline},
      {"status", std::string(to_string_view(summary.status))},
      {"reason", std::string(to_string_view(summary.reason))},
      {"event", event_json(summary.event)},
      {"created_at", util::format_iso8601(summary.created_at)},
      {"finished_at", util::format_iso8601(summary.finished_at)},
  };
}

auto to_json(const Run &run, bool include_output) -> JsonValue {
  auto obj = to_json(run.summary());
  obj.get_object().emplace("started_at",
                           util::format_iso8601(run.started_at()));
  JsonValue jobs = std::vector<JsonValue>{};
  for (const auto &job : run.jobs()) {
    jobs.get_array().emplace_back(job_json(job, include_output));
  }
  obj.get_object().emplace("jobs", std::move(jobs));
  return obj;
}

} // namespace ciforge
