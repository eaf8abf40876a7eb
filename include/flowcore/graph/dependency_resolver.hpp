#pragma once

#include "flowcore/executor/predicate_evaluator.hpp"
#include "flowcore/graph/dependency_graph.hpp"
#include "flowcore/model/workflow.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace flowcore {

enum class EdgeRole : std::uint8_t {
  Dependency,  // explicit edge, condition path or sequential chain
  Containment, // parallel/sequential parent -> child
  LoopBody,    // loop -> body step; the loop drives the body itself
};

struct EdgeInfo {
  DependencyType type{DependencyType::Completion};
  bool optional{false};
  std::string condition;
  EdgeRole role{EdgeRole::Dependency};
};

enum class Readiness : std::uint8_t { Waiting, Ready, Cancel, Skip };

struct ResolveContext {
  std::span<const WorkflowStep> steps;
  const JsonValue &context;
  const PredicateEvaluator &evaluator;
};

// Standalone tasks; node indices equal positions in `tasks`.
struct TaskResolveContext {
  std::span<const Task> tasks;
  const PredicateEvaluator &evaluator;
};

// Pending nodes whose fate was decided by one resolve pass. Cancellation and
// skipping are applied transitively within the pass.
struct Resolution {
  std::vector<NodeIndex> ready;
  std::vector<NodeIndex> cancelled;
  std::vector<NodeIndex> skipped;
};

[[nodiscard]] auto is_skipped(const NodeLifecycle &lc) noexcept -> bool;

// Workflow context plus {"steps": {id: output}} for every completed step.
[[nodiscard]] auto make_evaluation_context(std::span<const WorkflowStep> steps,
                                           const JsonValue &context)
    -> JsonValue;

// {"tasks": {id: output}} for every completed task.
[[nodiscard]] auto make_task_evaluation_context(std::span<const Task> tasks)
    -> JsonValue;

// Step graph of one workflow. Node indices equal positions in
// WorkflowGraph::steps. Implicit edges for condition paths, sequential chains,
// container membership and loop bodies are added next to the explicit ones.
// The task pool builds its graph incrementally through add_node() and
// add_dependency() instead.
class DependencyResolver {
public:
  [[nodiscard]] static auto from_graph(const WorkflowGraph &graph)
      -> Result<DependencyResolver>;

  // Returns the existing index when `key` is already known.
  [[nodiscard]] auto add_node(std::string_view key) -> Result<NodeIndex>;
  // Explicit edge; DuplicateId, CycleDetected or InvalidArgument (self edge)
  // leave the graph unchanged.
  [[nodiscard]] auto add_dependency(NodeIndex upstream, NodeIndex downstream,
                                    EdgeInfo info) -> Result<void>;

  [[nodiscard]] auto evaluate(NodeIndex idx, const ResolveContext &ctx) const
      -> Readiness;

  [[nodiscard]] auto resolve(const ResolveContext &ctx) const -> Resolution;
  [[nodiscard]] auto resolve(const TaskResolveContext &ctx) const
      -> Resolution;

  // Pending nodes that are ready plus nodes already queued.
  [[nodiscard]] auto ready_set(const ResolveContext &ctx) const
      -> std::vector<NodeIndex>;

  // Container or loop owning `idx`, or kInvalidNode.
  [[nodiscard]] auto parent_of(NodeIndex idx) const noexcept -> NodeIndex {
    return idx < parent_.size() ? parent_[idx] : kInvalidNode;
  }
  [[nodiscard]] auto children_of(NodeIndex idx) const -> std::vector<NodeIndex>;
  [[nodiscard]] auto upstream_of(NodeIndex idx) const -> std::vector<NodeIndex>;

  [[nodiscard]] auto edge(EdgeIndex e) const -> const EdgeInfo & {
    return edges_.at(e);
  }
  [[nodiscard]] auto graph() const noexcept -> const DependencyGraph & {
    return graph_;
  }
  [[nodiscard]] auto index_of(const StepId &id) const -> NodeIndex {
    return graph_.index_of(id.value());
  }
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return graph_.size();
  }

private:
  struct NodeView {
    NodeStatus status;
    bool skipped;
    const JsonValue *output;
  };

  [[nodiscard]] static auto view_of(const NodeLifecycle &lc) -> NodeView {
    return {lc.status, is_skipped(lc), &lc.output_data};
  }

  [[nodiscard]] auto add_edge(NodeIndex upstream, NodeIndex downstream,
                              EdgeInfo info, bool implicit) -> Result<void>;
  [[nodiscard]] auto set_parent(NodeIndex child, NodeIndex parent)
      -> Result<void>;
  [[nodiscard]] auto evaluate_view(NodeIndex idx,
                                   const PredicateEvaluator &evaluator,
                                   std::span<const NodeView> view,
                                   const JsonValue &eval_ctx) const
      -> Readiness;
  [[nodiscard]] auto resolve_view(std::vector<NodeView> view,
                                  const PredicateEvaluator &evaluator,
                                  const JsonValue &eval_ctx) const
      -> Resolution;

  DependencyGraph graph_;
  std::vector<EdgeInfo> edges_;
  std::vector<NodeIndex> parent_;
};

} // namespace flowcore
