#include "ciforge/pipeline/job_graph.hpp"

#include <algorithm>
#include <utility>

namespace ciforge {

auto JobGraph::add_node(std::string job_name) -> Result<JobIndex> {
  if (name_to_idx_.contains(job_name)) {
    return fail(Error::InvalidArgument);
  }
  const auto idx = static_cast<JobIndex>(nodes_.size());
  name_to_idx_.emplace(job_name, idx);
  nodes_.push_back(Node{.name = std::move(job_name)});
  return ok(idx);
}

auto JobGraph::add_edge(JobIndex from, JobIndex to) -> Result<void> {
  if (from >= nodes_.size() || to >= nodes_.size() || from == to) [[unlikely]] {
    return fail(Error::InvalidArgument);
  }
  auto &deps = nodes_[to].deps;
  if (std::ranges::find(deps, from) != deps.end()) {
    return ok();
  }
  deps.push_back(from);
  nodes_[from].dependents.push_back(to);
  return ok();
}

auto JobGraph::index_of(std::string_view job_name) const -> JobIndex {
  auto it = name_to_idx_.find(std::string(job_name));
  return it != name_to_idx_.end() ? it->second : kInvalidJob;
}

auto JobGraph::name_of(JobIndex idx) const -> std::string_view {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].name;
}

auto JobGraph::find_cycle() const -> std::vector<std::string> {
  // 0 = unvisited, 1 = on stack, 2 = done
  std::vector<std::uint8_t> state(nodes_.size(), 0);
  std::vector<std::pair<JobIndex, std::size_t>> stack;
  stack.reserve(nodes_.size());

  for (JobIndex start = 0; start < nodes_.size(); ++start) {
    if (state[start] != 0)
      continue;

    stack.emplace_back(start, 0);
    state[start] = 1;

    while (!stack.empty()) {
      auto &[node, child_idx] = stack.back();
      const auto &next = nodes_[node].dependents;

      if (child_idx < next.size()) {
        const JobIndex child = next[child_idx++];
        if (state[child] == 1) {
          std::vector<std::string> cycle;
          auto it = std::ranges::find_if(
              stack, [child](const auto &frame) { return frame.first == child; });
          for (; it != stack.end(); ++it) {
            cycle.push_back(nodes_[it->first].name);
          }
          cycle.push_back(nodes_[child].name);
          return cycle;
        }
        if (state[child] == 0) {
          state[child] = 1;
          stack.emplace_back(child, 0);
        }
      } else {
        state[node] = 2;
        stack.pop_back();
      }
    }
  }
  return {};
}

auto JobGraph::topological_order() const -> std::vector<JobIndex> {
  std::vector<std::size_t> in_degree;
  in_degree.reserve(nodes_.size());
  for (const auto &node : nodes_) {
    in_degree.push_back(node.deps.size());
  }

  std::vector<JobIndex> order;
  order.reserve(nodes_.size());
  for (JobIndex i = 0; i < nodes_.size(); ++i) {
    if (in_degree[i] == 0) {
      order.push_back(i);
    }
  }

  for (std::size_t head = 0; head < order.size(); ++head) {
    for (JobIndex dep : nodes_[order[head]].dependents) {
      if (--in_degree[dep] == 0) {
        order.push_back(dep);
      }
    }
  }
  return order;
}

auto JobGraph::deps(JobIndex idx) const noexcept -> std::span<const JobIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].deps;
}

auto JobGraph::dependents(JobIndex idx) const noexcept
    -> std::span<const JobIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].dependents;
}

} // namespace ciforge
