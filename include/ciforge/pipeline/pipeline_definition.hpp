#pragma once

#include "ciforge/intake/event.hpp"
#include "ciforge/pipeline/branch_matcher.hpp"
#include "ciforge/pipeline/job_graph.hpp"
#include "ciforge/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace ciforge {

using EnvMap = std::map<std::string, std::string, std::less<>>;

enum class StepType : std::uint8_t { Shell, Exec };
BOOST_DESCRIBE_ENUM(StepType, Shell, Exec)
CIFORGE_DEFINE_ENUM_SERDE(StepType, StepType::Shell)

namespace pipeline_defaults {
inline constexpr std::chrono::seconds kJobTimeout{3600};
inline constexpr std::chrono::seconds kMaxJobTimeout{30 * 24 * 3600};
} // namespace pipeline_defaults

struct StepDefinition {
  std::string name;
  StepType type{StepType::Shell};
  std::string run;
  EnvMap env;
  std::string working_dir;
};

struct JobDefinition {
  std::string name;
  std::vector<StepDefinition> steps;
  EnvMap env;
  std::chrono::seconds timeout{pipeline_defaults::kJobTimeout};
  std::vector<std::string> needs;
  BranchFilter branches;

  [[nodiscard]] auto matches_branch(std::string_view branch) const -> bool {
    return branches.matches(branch);
  }
};

struct TriggerFilter {
  std::vector<EventType> events; // empty = every event type
  BranchFilter branches;
  std::vector<std::string> repositories; // empty = every repository

  [[nodiscard]] auto matches(const TriggerEvent &event) const -> bool;
};

/// Validated, immutable pipeline. Shared between runs through
/// std::shared_ptr<const PipelineDefinition>.
struct PipelineDefinition {
  std::string name;
  std::string source_path;
  EnvMap env;
  TriggerFilter triggers;
  std::vector<JobDefinition> jobs;
  JobGraph graph; // node i is jobs[i]

  [[nodiscard]] auto matches(const TriggerEvent &event) const -> bool {
    return triggers.matches(event);
  }

  [[nodiscard]] auto find_job(std::string_view job_name) const
      -> const JobDefinition *;

  /// Jobs to run for `branch`: every job whose branch filter matches and
  /// whose dependencies are all admitted, in declaration order.
  [[nodiscard]] auto admitted_jobs(std::string_view branch) const
      -> std::vector<JobIndex>;
};

} // namespace ciforge
