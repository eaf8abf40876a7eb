#pragma once

#include "flowcore/core/error.hpp"
#include "flowcore/model/node.hpp"
#include "flowcore/model/workflow.hpp"
#include "flowcore/util/id.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace flowcore {

struct NodeRef {
  NodeId id;
  WorkflowId workflow_id; // empty for standalone tasks
};

struct TransitionPayload {
  std::optional<ErrorInfo> error;
  std::optional<JsonValue> output;
  std::string detail;
  int attempt{0};
  // Set on running->failed when a retry follows; the failure is not terminal.
  bool will_retry{false};
  // Retry due time, set on failed->retrying.
  std::optional<TimePoint> scheduled_at;
  // Lifecycle after the transition; filled in by the state machine so the
  // store keeps timestamps, counters and results alongside the status.
  std::optional<NodeLifecycle> lifecycle;
};

struct AuditEntry {
  std::uint64_t seq{0};
  TimePoint at{};
  WorkflowId workflow_id;
  NodeId node_id; // empty for workflow-level entries
  std::string from;
  std::string to;
  std::string event;
  std::string detail;
};

// Persistence boundary of the orchestrator. Every status write is a
// compare-and-swap on the persisted status, and every accepted transition
// produces exactly one audit entry.
class GraphStore {
public:
  virtual ~GraphStore() = default;

  // Workflow graphs
  virtual auto save_graph(const WorkflowGraph &graph) -> Result<void> = 0;
  [[nodiscard]] virtual auto load_graph(const WorkflowId &id) const
      -> Result<WorkflowGraph> = 0;

  // Returns Conflict when the persisted status is not `from`.
  virtual auto save_transition(const NodeRef &node, NodeStatus from,
                               NodeStatus to, const TransitionPayload &payload)
      -> Result<void> = 0;
  // Persists `next` (status, timestamps, results, root cause) when the stored
  // status is still `from`.
  virtual auto save_workflow_transition(const Workflow &next,
                                        WorkflowStatus from,
                                        std::string_view detail)
      -> Result<void> = 0;
  [[nodiscard]] virtual auto node_status(const NodeId &id) const
      -> Result<NodeStatus> = 0;

  // Audit
  virtual auto append_audit(AuditEntry entry) -> Result<void> = 0;
  [[nodiscard]] virtual auto audit_trail(const WorkflowId &id) const
      -> std::vector<AuditEntry> = 0;

  // Tasks
  virtual auto save_task(const Task &task) -> Result<void> = 0;
  [[nodiscard]] virtual auto load_task(const TaskId &id) const
      -> Result<Task> = 0;
  // Removes the task, its dependency edges and nested subtasks. Returns the
  // number of tasks removed.
  virtual auto delete_task(const TaskId &id) -> Result<std::size_t> = 0;
  virtual auto add_task_dependency(const TaskDependency &dep)
      -> Result<void> = 0;
  [[nodiscard]] virtual auto task_dependencies(const TaskId &id) const
      -> std::vector<TaskDependency> = 0;
  // Tasks mirrored from the steps of workflow `id`.
  [[nodiscard]] virtual auto tasks_of(const WorkflowId &id) const
      -> std::vector<Task> = 0;
};

} // namespace flowcore
