#include "flowcore/graph/dependency_graph.hpp"

#include <algorithm>
#include <numeric>
#include <ranges>
#include <utility>

namespace flowcore {

auto DependencyGraph::add_node(std::string_view key) -> Result<NodeIndex> {
  if (key.empty()) {
    return fail(Error::InvalidArgument);
  }
  if (auto it = key_to_idx_.find(key); it != key_to_idx_.end()) {
    return ok(it->second);
  }

  auto idx = static_cast<NodeIndex>(nodes_.size());
  nodes_.emplace_back();
  keys_.emplace_back(key);
  ord_.push_back(nodes_.size() - 1);
  key_to_idx_.emplace(std::string(key), idx);
  visited_.resize(nodes_.size());
  return ok(idx);
}

auto DependencyGraph::add_edge(std::string_view upstream,
                               std::string_view downstream)
    -> Result<EdgeIndex> {
  NodeIndex from = index_of(upstream);
  NodeIndex to = index_of(downstream);
  if (from == kInvalidNode || to == kInvalidNode) [[unlikely]] {
    return fail(Error::MissingReference);
  }
  return add_edge(from, to);
}

auto DependencyGraph::add_edge(NodeIndex upstream, NodeIndex downstream)
    -> Result<EdgeIndex> {
  if (upstream >= nodes_.size() || downstream >= nodes_.size()) [[unlikely]] {
    return fail(Error::MissingReference);
  }
  if (upstream == downstream) {
    return fail(Error::InvalidArgument);
  }
  if (has_edge(upstream, downstream)) {
    return fail(Error::DuplicateId);
  }

  if (ord_[downstream] < ord_[upstream]) {
    const auto lower = ord_[downstream];
    const auto upper = ord_[upstream];

    std::vector<NodeIndex> forward;
    const bool acyclic = collect_forward(downstream, upstream, upper, forward);
    if (!acyclic) {
      for (auto n : forward) {
        visited_.reset(n);
      }
      return fail(Error::CycleDetected);
    }
    std::vector<NodeIndex> backward;
    collect_backward(upstream, lower, backward);
    for (auto n : forward) {
      visited_.reset(n);
    }
    for (auto n : backward) {
      visited_.reset(n);
    }
    reorder(backward, forward);
  }

  const EdgeIndex edge = next_edge_++;
  nodes_[upstream].dependents.push_back(
      Adjacent{.node = downstream, .edge = edge});
  nodes_[downstream].deps.push_back(Adjacent{.node = upstream, .edge = edge});
  ++edge_count_;
  return ok(edge);
}

auto DependencyGraph::collect_forward(NodeIndex start, NodeIndex target,
                                      std::size_t upper,
                                      std::vector<NodeIndex> &out) const
    -> bool {
  std::vector<NodeIndex> stack{start};
  visited_.set(start);
  out.push_back(start);

  while (!stack.empty()) {
    NodeIndex cur = stack.back();
    stack.pop_back();
    for (const auto &next : nodes_[cur].dependents) {
      if (next.node == target) {
        return false;
      }
      if (visited_.test(next.node) || ord_[next.node] > upper) {
        continue;
      }
      visited_.set(next.node);
      out.push_back(next.node);
      stack.push_back(next.node);
    }
  }
  return true;
}

auto DependencyGraph::collect_backward(NodeIndex start, std::size_t lower,
                                       std::vector<NodeIndex> &out) const
    -> void {
  std::vector<NodeIndex> stack{start};
  visited_.set(start);
  out.push_back(start);

  while (!stack.empty()) {
    NodeIndex cur = stack.back();
    stack.pop_back();
    for (const auto &prev : nodes_[cur].deps) {
      if (visited_.test(prev.node) || ord_[prev.node] < lower) {
        continue;
      }
      visited_.set(prev.node);
      out.push_back(prev.node);
      stack.push_back(prev.node);
    }
  }
}

// Everything that reaches `upstream` must end up before everything reachable
// from `downstream`; reuse the affected order slots in ascending order.
auto DependencyGraph::reorder(std::vector<NodeIndex> &backward,
                              std::vector<NodeIndex> &forward) -> void {
  auto by_ord = [this](NodeIndex a, NodeIndex b) { return ord_[a] < ord_[b]; };
  std::ranges::sort(backward, by_ord);
  std::ranges::sort(forward, by_ord);

  std::vector<std::size_t> slots;
  slots.reserve(backward.size() + forward.size());
  for (auto n : backward) {
    slots.push_back(ord_[n]);
  }
  for (auto n : forward) {
    slots.push_back(ord_[n]);
  }
  std::ranges::sort(slots);

  std::size_t i = 0;
  for (auto n : backward) {
    ord_[n] = slots[i++];
  }
  for (auto n : forward) {
    ord_[n] = slots[i++];
  }
}

auto DependencyGraph::would_create_cycle(NodeIndex upstream,
                                         NodeIndex downstream) const -> bool {
  if (upstream >= nodes_.size() || downstream >= nodes_.size()) {
    return false;
  }
  if (upstream == downstream) {
    return true;
  }
  if (ord_[downstream] > ord_[upstream]) {
    return false;
  }
  std::vector<NodeIndex> seen;
  const bool acyclic =
      collect_forward(downstream, upstream, ord_[upstream], seen);
  for (auto n : seen) {
    visited_.reset(n);
  }
  return !acyclic;
}

auto DependencyGraph::remove_node_edges(NodeIndex idx) -> std::size_t {
  if (idx >= nodes_.size()) {
    return 0;
  }
  std::size_t removed = 0;
  auto drop = [idx](std::vector<Adjacent> &list) {
    return std::erase_if(list,
                         [idx](const Adjacent &a) { return a.node == idx; });
  };
  for (const auto &dep : nodes_[idx].deps) {
    removed += drop(nodes_[dep.node].dependents);
  }
  for (const auto &dependent : nodes_[idx].dependents) {
    removed += drop(nodes_[dependent.node].deps);
  }
  nodes_[idx].deps.clear();
  nodes_[idx].dependents.clear();
  edge_count_ -= removed;
  return removed;
}

auto DependencyGraph::has_edge(NodeIndex upstream,
                               NodeIndex downstream) const noexcept -> bool {
  if (upstream >= nodes_.size() || downstream >= nodes_.size()) [[unlikely]] {
    return false;
  }
  return std::ranges::any_of(
      nodes_[upstream].dependents,
      [downstream](const Adjacent &a) { return a.node == downstream; });
}

auto DependencyGraph::has_node(std::string_view key) const -> bool {
  return key_to_idx_.contains(key);
}

auto DependencyGraph::topological_order() const -> std::vector<NodeIndex> {
  std::vector<NodeIndex> order(nodes_.size());
  std::iota(order.begin(), order.end(), NodeIndex{0});
  std::ranges::sort(order,
                    [this](NodeIndex a, NodeIndex b) { return ord_[a] < ord_[b]; });
  return order;
}

auto DependencyGraph::deps(NodeIndex idx) const noexcept
    -> std::span<const Adjacent> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].deps;
}

auto DependencyGraph::dependents(NodeIndex idx) const noexcept
    -> std::span<const Adjacent> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].dependents;
}

auto DependencyGraph::index_of(std::string_view key) const -> NodeIndex {
  auto it = key_to_idx_.find(key);
  return it != key_to_idx_.end() ? it->second : kInvalidNode;
}

auto DependencyGraph::key_of(NodeIndex idx) const -> const std::string & {
  static const std::string kEmpty;
  return idx < keys_.size() ? keys_[idx] : kEmpty;
}

auto DependencyGraph::clear() -> void {
  nodes_.clear();
  keys_.clear();
  ord_.clear();
  key_to_idx_.clear();
  visited_.clear();
  next_edge_ = 0;
  edge_count_ = 0;
}

} // namespace flowcore
