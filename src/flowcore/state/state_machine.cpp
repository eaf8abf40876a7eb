#include "flowcore/state/state_machine.hpp"

#include "flowcore/util/log.hpp"

namespace flowcore {

auto StateMachine::is_legal(NodeStatus from, NodeStatus to) noexcept -> bool {
  using enum NodeStatus;
  if (to == Cancelled) {
    return !is_terminal(from);
  }
  switch (from) {
  case Pending:
    return to == Queued;
  case Queued:
    return to == Running;
  case Running:
    return to == Completed || to == Failed || to == Paused;
  case Paused:
    return to == Running;
  case Failed:
    return to == Retrying;
  case Retrying:
    return to == Queued;
  case Completed:
  case Cancelled:
    return false;
  }
  return false;
}

auto StateMachine::is_legal(WorkflowStatus from, WorkflowStatus to) noexcept
    -> bool {
  using enum WorkflowStatus;
  switch (from) {
  case Draft:
    return to == Ready;
  case Ready:
    return to == Running || to == Cancelled;
  case Running:
    return to == Paused || to == Completed || to == Failed || to == Cancelled;
  case Paused:
    return to == Running || to == Failed || to == Cancelled;
  case Completed:
  case Failed:
  case Cancelled:
    return false;
  }
  return false;
}

auto StateMachine::transition(NodeLifecycle &node, const NodeRef &ref,
                              NodeStatus expected_from, NodeStatus to,
                              TransitionPayload payload, TimePoint now)
    -> Result<void> {
  if (node.status != expected_from) {
    log::info("transition {} {}->{} rejected: node is {}", ref.id,
              expected_from, to, node.status);
    return flowcore::fail(Error::Conflict);
  }
  // A terminal failure (completed_at set) or an exhausted budget never
  // leaves failed.
  const bool leaving_failed = expected_from == NodeStatus::Failed;
  if (!is_legal(expected_from, to) ||
      (leaving_failed && (node.retry_count >= node.max_retries ||
                          node.completed_at.has_value()))) {
    log::warn("illegal transition {} {}->{}", ref.id, expected_from, to);
    return flowcore::fail(Error::InvalidState);
  }

  // Build the next lifecycle first so the store persists the full record.
  NodeLifecycle next = node;
  next.status = to;
  next.updated_at = now;
  if (to == NodeStatus::Running) {
    if (!next.started_at) {
      next.started_at = now;
    }
    next.attempt_started_at = now;
  }
  if (to == NodeStatus::Retrying) {
    ++next.retry_count;
  }
  if (payload.error) {
    next.error_info = payload.error;
  }
  if (payload.output) {
    next.output_data = *payload.output;
  }
  if (payload.scheduled_at) {
    next.scheduled_at = payload.scheduled_at;
  }
  const bool final_state =
      is_terminal(to) && !(to == NodeStatus::Failed && payload.will_retry);
  if (final_state && !next.completed_at) {
    next.completed_at = now;
    if (to == NodeStatus::Completed && next.started_at) {
      next.actual_duration =
          std::chrono::duration_cast<Duration>(now - *next.started_at);
    }
  }
  payload.lifecycle = next;

  if (auto res = store_.save_transition(ref, expected_from, to, payload);
      !res) {
    if (res.error() == make_error_code(Error::Conflict)) {
      log::info("transition {} {}->{} discarded: stale persisted state", ref.id,
                expected_from, to);
    } else {
      log::error("failed to persist transition {} {}->{}: {}", ref.id,
                 expected_from, to, res.error().message());
    }
    return res;
  }
  node = std::move(next);
  log::debug("{} {} -> {}", ref.id, expected_from, to);
  return ok();
}

auto StateMachine::transition(Workflow &workflow, WorkflowStatus expected_from,
                              WorkflowStatus to, std::string_view detail,
                              TimePoint now) -> Result<void> {
  if (workflow.status != expected_from) {
    return flowcore::fail(Error::Conflict);
  }
  if (!is_legal(expected_from, to)) {
    log::warn("illegal workflow transition {} {}->{}", workflow.id,
              expected_from, to);
    return flowcore::fail(Error::InvalidState);
  }
  Workflow next = workflow;
  next.status = to;
  next.updated_at = now;
  if (to == WorkflowStatus::Running && !next.started_at) {
    next.started_at = now;
  }
  if (is_terminal(to) && !next.completed_at) {
    next.completed_at = now;
  }
  if (auto res = store_.save_workflow_transition(next, expected_from, detail);
      !res) {
    log::error("failed to persist workflow transition {} {}->{}: {}",
               workflow.id, expected_from, to, res.error().message());
    return res;
  }
  workflow = std::move(next);
  log::info("workflow {} {} -> {}", workflow.id, expected_from, to);
  return ok();
}

auto StateMachine::fail(NodeLifecycle &node, const NodeRef &ref,
                        NodeStatus expected_from, ErrorInfo error,
                        std::optional<Duration> retry_after, TimePoint now)
    -> Result<NodeStatus> {
  if (error.at == TimePoint{}) {
    error.at = now;
  }
  const bool retry =
      retry_after.has_value() && node.retry_count < node.max_retries;

  if (auto res = transition(node, ref, expected_from, NodeStatus::Failed,
                            TransitionPayload{.error = error,
                                              .attempt = node.retry_count + 1,
                                              .will_retry = retry},
                            now);
      !res) {
    return flowcore::fail(res.error());
  }
  if (!retry) {
    log::warn("{} failed ({}): {}", ref.id, error.kind, error.message);
    return ok(NodeStatus::Failed);
  }

  auto res = transition(
      node, ref, NodeStatus::Failed, NodeStatus::Retrying,
      TransitionPayload{.detail = std::format("retry {}/{} in {}ms",
                                              node.retry_count + 1,
                                              node.max_retries,
                                              retry_after->count()),
                        .scheduled_at = now + *retry_after},
      now);
  if (!res) {
    return flowcore::fail(res.error());
  }
  log::info("{} failed ({}), retry {}/{} in {}ms", ref.id, error.kind,
            node.retry_count, node.max_retries, retry_after->count());
  return ok(NodeStatus::Retrying);
}

auto StateMachine::cancel(NodeLifecycle &node, const NodeRef &ref,
                          ErrorInfo error, TimePoint now) -> Result<void> {
  if (is_terminal(node.status)) {
    return flowcore::fail(Error::InvalidState);
  }
  if (error.at == TimePoint{}) {
    error.at = now;
  }
  return transition(node, ref, node.status, NodeStatus::Cancelled,
                    TransitionPayload{.error = std::move(error)}, now);
}

} // namespace flowcore
