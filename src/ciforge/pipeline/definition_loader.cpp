#include "ciforge/pipeline/definition_loader.hpp"

#include "ciforge/config/toml_util.hpp"
#include "ciforge/executor/executor_utils.hpp"
#include "ciforge/util/log.hpp"

#include <glaze/toml.hpp>

#include <cstdint>
#include <format>
#include <limits>
#include <map>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace ciforge {
namespace detail {

inline constexpr std::int64_t kUnsetTimeout =
    std::numeric_limits<std::int64_t>::min();

struct StepToml {
  std::string name;
  std::string type{"shell"};
  std::string run;
  std::map<std::string, std::string> env;
  std::string working_dir;
};

struct JobToml {
  std::string name;
  std::vector<StepToml> steps;
  std::map<std::string, std::string> env;
  std::int64_t timeout{kUnsetTimeout};
  std::int64_t timeout_minutes{kUnsetTimeout};
  std::vector<std::string> needs;
  std::vector<std::string> branches;
};

struct TriggersToml {
  std::vector<std::string> events;
  std::vector<std::string> branches;
  std::vector<std::string> repositories;
};

struct PipelineToml {
  std::string name;
  std::map<std::string, std::string> env;
  TriggersToml triggers{};
  std::vector<JobToml> jobs;
};

} // namespace detail
} // namespace ciforge

namespace glz {
template <> struct meta<ciforge::detail::StepToml> {
  using T = ciforge::detail::StepToml;
  static constexpr auto value =
      object("name", &T::name, "type", &T::type, "run", &T::run, "env",
             &T::env, "working_dir", &T::working_dir);
};

template <> struct meta<ciforge::detail::JobToml> {
  using T = ciforge::detail::JobToml;
  static constexpr auto value =
      object("name", &T::name, "steps", &T::steps, "env", &T::env, "timeout",
             &T::timeout, "timeout_minutes", &T::timeout_minutes, "needs",
             &T::needs, "branches", &T::branches);
};

template <> struct meta<ciforge::detail::TriggersToml> {
  using T = ciforge::detail::TriggersToml;
  static constexpr auto value =
      object("events", &T::events, "branches", &T::branches, "repositories",
             &T::repositories);
};

template <> struct meta<ciforge::detail::PipelineToml> {
  using T = ciforge::detail::PipelineToml;
  static constexpr auto value = object("name", &T::name, "env", &T::env,
                                       "triggers", &T::triggers, "jobs",
                                       &T::jobs);
};
} // namespace glz

namespace ciforge {
namespace {

using Errors = std::vector<std::string>;

auto check_env(const std::map<std::string, std::string> &env,
               std::string_view where, Errors &errors) -> EnvMap {
  EnvMap out;
  for (const auto &[key, value] : env) {
    if (!is_valid_env_key(key)) {
      errors.push_back(std::format("{}: invalid environment key '{}'", where, key));
      continue;
    }
    out.emplace(key, value);
  }
  return out;
}

auto compile_filter(const std::vector<std::string> &patterns,
                    std::string_view where, Errors &errors) -> BranchFilter {
  std::vector<BranchMatcher> matchers;
  matchers.reserve(patterns.size());
  for (const auto &pattern : patterns) {
    auto compiled = BranchMatcher::compile(pattern);
    if (!compiled) {
      errors.push_back(
          std::format("{}: invalid branch pattern '{}'", where, pattern));
      continue;
    }
    matchers.push_back(std::move(*compiled));
  }
  return BranchFilter{std::move(matchers)};
}

auto resolve_timeout(const detail::JobToml &raw, std::string_view where,
                     Errors &errors) -> std::chrono::seconds {
  if (raw.timeout != detail::kUnsetTimeout &&
      raw.timeout_minutes != detail::kUnsetTimeout) {
    errors.push_back(
        std::format("{}: set either 'timeout' or 'timeout_minutes'", where));
    return pipeline_defaults::kJobTimeout;
  }
  constexpr auto kMaxSeconds = pipeline_defaults::kMaxJobTimeout.count();
  std::int64_t seconds = pipeline_defaults::kJobTimeout.count();
  if (raw.timeout != detail::kUnsetTimeout) {
    seconds = raw.timeout;
  } else if (raw.timeout_minutes != detail::kUnsetTimeout) {
    // Checked before multiplying so huge minute counts cannot overflow.
    seconds = raw.timeout_minutes > kMaxSeconds / 60 ? kMaxSeconds + 1
                                                     : raw.timeout_minutes * 60;
  }
  if (seconds <= 0) {
    errors.push_back(std::format("{}: timeout must be positive", where));
    return pipeline_defaults::kJobTimeout;
  }
  if (seconds > kMaxSeconds) {
    errors.push_back(
        std::format("{}: timeout must not exceed 30 days", where));
    return pipeline_defaults::kJobTimeout;
  }
  return std::chrono::seconds{seconds};
}

auto convert_step(const detail::StepToml &raw, std::size_t index,
                  std::string_view job_name, Errors &errors)
    -> StepDefinition {
  StepDefinition step;
  step.name = raw.name.empty() ? std::format("step-{}", index + 1) : raw.name;
  const auto where = std::format("job '{}' step '{}'", job_name, step.name);

  if (auto type = try_parse<StepType>(raw.type); type) {
    step.type = *type;
  } else {
    errors.push_back(std::format("{}: unknown step type '{}'", where, raw.type));
  }

  step.run = raw.run;
  if (step.run.find_first_not_of(" \t\r\n") == std::string::npos) {
    errors.push_back(std::format("{}: 'run' command is empty", where));
  } else if (step.type == StepType::Exec && !split_command_line(step.run)) {
    errors.push_back(
        std::format("{}: cannot split exec command (unbalanced quotes?)", where));
  }

  step.env = check_env(raw.env, where, errors);
  step.working_dir = raw.working_dir;
  return step;
}

auto convert_job(const detail::JobToml &raw, std::size_t index, Errors &errors)
    -> JobDefinition {
  JobDefinition job;
  job.name = raw.name;
  if (job.name.empty()) {
    errors.push_back(std::format("job #{}: missing required field 'name'", index + 1));
    job.name = std::format("#{}", index + 1);
  }
  const auto where = std::format("job '{}'", job.name);

  if (raw.steps.empty()) {
    errors.push_back(std::format("{}: must have at least one step", where));
  }
  std::unordered_set<std::string> step_names;
  job.steps.reserve(raw.steps.size());
  for (std::size_t i = 0; i < raw.steps.size(); ++i) {
    auto step = convert_step(raw.steps[i], i, job.name, errors);
    if (!step_names.insert(step.name).second) {
      errors.push_back(
          std::format("{}: duplicate step name '{}'", where, step.name));
    }
    job.steps.push_back(std::move(step));
  }

  job.env = check_env(raw.env, where, errors);
  job.timeout = resolve_timeout(raw, where, errors);
  job.needs = raw.needs;
  job.branches = compile_filter(raw.branches, where, errors);
  return job;
}

auto build_graph(PipelineDefinition &def, Errors &errors) -> void {
  for (const auto &job : def.jobs) {
    if (auto added = def.graph.add_node(job.name); !added) {
      errors.push_back(std::format("duplicate job name '{}'", job.name));
    }
  }
  if (def.graph.size() != def.jobs.size()) {
    return;
  }

  for (JobIndex to = 0; to < def.jobs.size(); ++to) {
    const auto &job = def.jobs[to];
    for (const auto &need : job.needs) {
      if (need == job.name) {
        errors.push_back(
            std::format("job '{}': a job cannot need itself", job.name));
        continue;
      }
      const JobIndex from = def.graph.index_of(need);
      if (from == kInvalidJob) {
        errors.push_back(
            std::format("job '{}': needs unknown job '{}'", job.name, need));
        continue;
      }
      if (auto r = def.graph.add_edge(from, to); !r) {
        errors.push_back(std::format("job '{}': invalid dependency on '{}'",
                                     job.name, need));
      }
    }
  }

  if (auto cycle = def.graph.find_cycle(); !cycle.empty()) {
    std::string path;
    for (const auto &name : cycle) {
      if (!path.empty()) {
        path += " -> ";
      }
      path += name;
    }
    errors.push_back(std::format("dependency cycle: {}", path));
  }
}

auto parse_definition(std::string_view text, std::string *diagnostic,
                      std::string_view fallback_name)
    -> Result<PipelineDefinition> {
  auto raw_result = toml_util::parse_toml<detail::PipelineToml>(text, diagnostic);
  if (!raw_result) {
    return fail(Error::ParseError);
  }
  auto &raw = *raw_result;

  Errors errors;
  PipelineDefinition def;
  def.name = raw.name.empty() ? std::string(fallback_name) : raw.name;
  if (def.name.empty()) {
    errors.emplace_back("missing required top-level field 'name'");
  }

  def.env = check_env(raw.env, "[env]", errors);

  for (const auto &event : raw.triggers.events) {
    if (auto type = parse_event_alias(event); type) {
      def.triggers.events.push_back(*type);
    } else {
      errors.push_back(std::format("[triggers]: unknown event type '{}'", event));
    }
  }
  def.triggers.branches =
      compile_filter(raw.triggers.branches, "[triggers]", errors);
  def.triggers.repositories = raw.triggers.repositories;

  if (raw.jobs.empty()) {
    errors.emplace_back("pipeline must define at least one job");
  }
  def.jobs.reserve(raw.jobs.size());
  for (std::size_t i = 0; i < raw.jobs.size(); ++i) {
    def.jobs.push_back(convert_job(raw.jobs[i], i, errors));
  }
  if (!def.jobs.empty()) {
    build_graph(def, errors);
  }

  if (!errors.empty()) {
    std::string joined;
    for (const auto &e : errors) {
      if (!joined.empty()) {
        joined.push_back('\n');
      }
      joined += e;
    }
    log::debug("Pipeline '{}' failed validation: {}", def.name, joined);
    if (diagnostic) {
      *diagnostic = std::move(joined);
    }
    return fail(Error::ValidationError);
  }
  return ok(std::move(def));
}

} // namespace

auto DefinitionLoader::load(std::string_view toml_text, std::string *diagnostic)
    -> Result<PipelineDefinition> {
  try {
    return parse_definition(toml_text, diagnostic, {});
  } catch (const std::exception &e) {
    log::error("Failed to parse pipeline definition: {}", e.what());
    if (diagnostic) {
      *diagnostic = e.what();
    }
    return fail(Error::ParseError);
  }
}

auto DefinitionLoader::load_from_file(const std::filesystem::path &path,
                                      std::string *diagnostic)
    -> Result<PipelineDefinition> {
  auto text = toml_util::read_file(path);
  if (!text) {
    if (diagnostic) {
      *diagnostic = std::format("cannot read {}", path.string());
    }
    return fail(text.error());
  }
  try {
    auto def = parse_definition(*text, diagnostic, path.stem().string());
    if (def) {
      def->source_path = path.string();
    }
    return def;
  } catch (const std::exception &e) {
    log::error("Failed to parse pipeline file {}: {}", path.string(), e.what());
    if (diagnostic) {
      *diagnostic = e.what();
    }
    return fail(Error::ParseError);
  }
}

auto DefinitionLoader::load_shared(std::string_view toml_text,
                                   std::string *diagnostic)
    -> Result<std::shared_ptr<const PipelineDefinition>> {
  return load(toml_text, diagnostic)
      .transform([](PipelineDefinition def) {
        return std::make_shared<const PipelineDefinition>(std::move(def));
      });
}

} // namespace ciforge
