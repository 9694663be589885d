#include "ciforge/pipeline/pipeline_definition.hpp"

#include <algorithm>

namespace ciforge {

auto TriggerFilter::matches(const TriggerEvent &event) const -> bool {
  if (!events.empty() && std::ranges::find(events, event.event_type) ==
                             events.end()) {
    return false;
  }
  if (!repositories.empty() &&
      std::ranges::find(repositories, event.repository) ==
          repositories.end()) {
    return false;
  }
  return branches.matches(event.branch);
}

auto PipelineDefinition::find_job(std::string_view job_name) const
    -> const JobDefinition * {
  auto it = std::ranges::find(jobs, job_name, &JobDefinition::name);
  return it != jobs.end() ? &*it : nullptr;
}

auto PipelineDefinition::admitted_jobs(std::string_view branch) const
    -> std::vector<JobIndex> {
  std::vector<char> admitted(jobs.size(), 0);
  // Topological order guarantees every dependency is decided first.
  for (JobIndex idx : graph.topological_order()) {
    if (!jobs[idx].matches_branch(branch)) {
      continue;
    }
    const auto deps = graph.deps(idx);
    admitted[idx] = std::ranges::all_of(
        deps, [&](JobIndex dep) { return admitted[dep] != 0; });
  }

  std::vector<JobIndex> out;
  for (JobIndex i = 0; i < jobs.size(); ++i) {
    if (admitted[i] != 0) {
      out.push_back(i);
    }
  }
  return out;
}

} // namespace ciforge
