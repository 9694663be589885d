#pragma once

#include "ciforge/core/error.hpp"

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ciforge {

using JobIndex = std::uint32_t;
constexpr JobIndex kInvalidJob = UINT32_MAX;

/// Dependency graph over the jobs of one pipeline. Node indices follow the
/// declaration order of the jobs; an edge from -> to means `to` needs `from`.
class JobGraph {
public:
  [[nodiscard]] auto add_node(std::string job_name) -> Result<JobIndex>;
  [[nodiscard]] auto add_edge(JobIndex from, JobIndex to) -> Result<void>;

  [[nodiscard]] auto index_of(std::string_view job_name) const -> JobIndex;
  [[nodiscard]] auto name_of(JobIndex idx) const -> std::string_view;

  /// Empty when acyclic, otherwise the job names along one cycle, with the
  /// first name repeated at the end.
  [[nodiscard]] auto find_cycle() const -> std::vector<std::string>;
  [[nodiscard]] auto topological_order() const -> std::vector<JobIndex>;

  [[nodiscard]] auto deps(JobIndex idx) const noexcept
      -> std::span<const JobIndex>;
  [[nodiscard]] auto dependents(JobIndex idx) const noexcept
      -> std::span<const JobIndex>;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return nodes_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return nodes_.empty(); }

private:
  struct Node {
    std::string name;
    std::vector<JobIndex> deps;
    std::vector<JobIndex> dependents;
  };

  std::vector<Node> nodes_;
  ankerl::unordered_dense::map<std::string, JobIndex> name_to_idx_;
};

} // namespace ciforge
