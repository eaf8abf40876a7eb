#pragma once

#include "flowcore/graph/dependency_graph.hpp"
#include "flowcore/storage/graph_store.hpp"
#include "flowcore/util/string_hash.hpp"

#include <mutex>

namespace flowcore {

// In-process GraphStore. All state lives behind one mutex; nothing is shared
// between instances.
class MemoryGraphStore final : public GraphStore {
public:
  auto save_graph(const WorkflowGraph &graph) -> Result<void> override;
  [[nodiscard]] auto load_graph(const WorkflowId &id) const
      -> Result<WorkflowGraph> override;

  auto save_transition(const NodeRef &node, NodeStatus from, NodeStatus to,
                       const TransitionPayload &payload)
      -> Result<void> override;
  auto save_workflow_transition(const Workflow &next, WorkflowStatus from,
                                std::string_view detail)
      -> Result<void> override;
  [[nodiscard]] auto node_status(const NodeId &id) const
      -> Result<NodeStatus> override;

  auto append_audit(AuditEntry entry) -> Result<void> override;
  [[nodiscard]] auto audit_trail(const WorkflowId &id) const
      -> std::vector<AuditEntry> override;

  auto save_task(const Task &task) -> Result<void> override;
  [[nodiscard]] auto load_task(const TaskId &id) const -> Result<Task> override;
  auto delete_task(const TaskId &id) -> Result<std::size_t> override;
  auto add_task_dependency(const TaskDependency &dep) -> Result<void> override;
  [[nodiscard]] auto task_dependencies(const TaskId &id) const
      -> std::vector<TaskDependency> override;
  [[nodiscard]] auto tasks_of(const WorkflowId &id) const
      -> std::vector<Task> override;

  [[nodiscard]] auto audit_size() const -> std::size_t;

private:
  struct NodeRecord {
    NodeStatus status{NodeStatus::Pending};
    WorkflowId workflow_id;
    std::size_t step_index{0};
    std::optional<TaskId> task_id;
  };

  auto append_audit_locked(AuditEntry entry) -> void;
  auto delete_task_locked(const TaskId &id) -> std::size_t;

  mutable std::mutex mu_;
  StringMap<WorkflowGraph> graphs_;
  StringMap<NodeRecord> nodes_;
  StringMap<Task> tasks_;
  std::vector<TaskDependency> task_deps_;
  DependencyGraph task_graph_;
  std::vector<AuditEntry> audit_;
  std::uint64_t next_seq_{1};
};

} // namespace flowcore
