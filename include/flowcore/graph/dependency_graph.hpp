#pragma once

#include "flowcore/core/error.hpp"
#include "flowcore/util/string_hash.hpp"

#include <boost/dynamic_bitset.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace flowcore {

using NodeIndex = std::uint32_t;
using EdgeIndex = std::uint32_t;
constexpr NodeIndex kInvalidNode = UINT32_MAX;

struct Adjacent {
  NodeIndex node{kInvalidNode};
  EdgeIndex edge{0};
};

// Directed acyclic graph with an incrementally maintained topological order
// (Pearce-Kelly). An edge `upstream -> downstream` means downstream depends
// on upstream. Inserting an edge only searches the window of the order that
// lies between its endpoints, so add_edge stays cheap on large graphs.
class DependencyGraph {
public:
  [[nodiscard]] auto add_node(std::string_view key) -> Result<NodeIndex>;

  // Fails with CycleDetected and leaves the graph untouched when the edge
  // would close a cycle.
  [[nodiscard]] auto add_edge(NodeIndex upstream, NodeIndex downstream)
      -> Result<EdgeIndex>;
  [[nodiscard]] auto add_edge(std::string_view upstream,
                              std::string_view downstream) -> Result<EdgeIndex>;

  [[nodiscard]] auto remove_node_edges(NodeIndex idx) -> std::size_t;

  [[nodiscard]] auto would_create_cycle(NodeIndex upstream,
                                        NodeIndex downstream) const -> bool;
  [[nodiscard]] auto has_edge(NodeIndex upstream,
                              NodeIndex downstream) const noexcept -> bool;
  [[nodiscard]] auto has_node(std::string_view key) const -> bool;

  [[nodiscard]] auto topological_order() const -> std::vector<NodeIndex>;

  [[nodiscard]] auto deps(NodeIndex idx) const noexcept
      -> std::span<const Adjacent>;
  [[nodiscard]] auto dependents(NodeIndex idx) const noexcept
      -> std::span<const Adjacent>;

  [[nodiscard]] auto index_of(std::string_view key) const -> NodeIndex;
  [[nodiscard]] auto key_of(NodeIndex idx) const -> const std::string &;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return nodes_.size();
  }
  [[nodiscard]] auto edge_count() const noexcept -> std::size_t {
    return edge_count_;
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return nodes_.empty(); }
  auto clear() -> void;

private:
  struct Node {
    std::vector<Adjacent> deps;
    std::vector<Adjacent> dependents;
  };

  // Forward search from `start` over nodes ordered at or before `upper`.
  // Returns false as soon as `target` is reached.
  [[nodiscard]] auto collect_forward(NodeIndex start, NodeIndex target,
                                     std::size_t upper,
                                     std::vector<NodeIndex> &out) const -> bool;
  auto collect_backward(NodeIndex start, std::size_t lower,
                        std::vector<NodeIndex> &out) const -> void;
  auto reorder(std::vector<NodeIndex> &backward,
               std::vector<NodeIndex> &forward) -> void;

  std::vector<Node> nodes_;
  std::vector<std::string> keys_;
  std::vector<std::size_t> ord_;
  StringMap<NodeIndex> key_to_idx_;
  mutable boost::dynamic_bitset<> visited_;
  EdgeIndex next_edge_{0};
  std::size_t edge_count_{0};
};

} // namespace flowcore
