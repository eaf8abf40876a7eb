#pragma once

#include "flowcore/core/error.hpp"
#include "flowcore/model/node.hpp"
#include "flowcore/model/workflow.hpp"
#include "flowcore/storage/graph_store.hpp"

#include <optional>

namespace flowcore {

// Single writer of node status. Every transition is a compare-and-swap
// against both the in-memory lifecycle and the persisted status.
class StateMachine {
public:
  explicit StateMachine(GraphStore &store) : store_(store) {}

  [[nodiscard]] static auto is_legal(NodeStatus from, NodeStatus to) noexcept
      -> bool;
  [[nodiscard]] static auto is_legal(WorkflowStatus from,
                                     WorkflowStatus to) noexcept -> bool;

  // Conflict when `node.status != expected_from` or the store holds another
  // status; InvalidState when the edge is not part of the lifecycle.
  auto transition(NodeLifecycle &node, const NodeRef &ref,
                  NodeStatus expected_from, NodeStatus to,
                  TransitionPayload payload = {}, TimePoint now = Clock::now())
      -> Result<void>;

  // Records a failure. With `retry_after` set and budget left the node goes
  // running -> failed -> retrying and becomes due at now + retry_after;
  // otherwise it ends terminal failed. Returns the resulting status.
  auto fail(NodeLifecycle &node, const NodeRef &ref, NodeStatus expected_from,
            ErrorInfo error, std::optional<Duration> retry_after,
            TimePoint now = Clock::now()) -> Result<NodeStatus>;

  // Any non-terminal status -> cancelled, tagged with `error`.
  auto cancel(NodeLifecycle &node, const NodeRef &ref, ErrorInfo error,
              TimePoint now = Clock::now()) -> Result<void>;

  // Workflow-level counterpart of transition(); sets started_at on the first
  // entry to running and completed_at on the terminal entry.
  auto transition(Workflow &workflow, WorkflowStatus expected_from,
                  WorkflowStatus to, std::string_view detail = {},
                  TimePoint now = Clock::now()) -> Result<void>;

  [[nodiscard]] auto store() noexcept -> GraphStore & { return store_; }

private:
  GraphStore &store_;
};

} // namespace flowcore
