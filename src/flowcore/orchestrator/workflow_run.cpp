#include "flowcore/orchestrator/workflow_run.hpp"

#include "flowcore/util/log.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <format>
#include <ranges>
#include <utility>

namespace flowcore {

WorkflowRun::WorkflowRun(WorkflowGraph graph, DependencyResolver resolver,
                         EngineServices &services, std::uint64_t start_seq)
    : id_(graph.workflow.id), start_seq_(start_seq), services_(services),
      strand_(boost::asio::make_strand(services.executor)),
      graph_(std::move(graph)), resolver_(std::move(resolver)),
      runtime_(graph_.steps.size()) {
  if (!graph_.workflow.results.is_object()) {
    graph_.workflow.results = make_json_object();
  }
  for (auto [i, step] : graph_.steps | std::views::enumerate) {
    if (step.type() == StepType::Task) {
      runtime_[i].task_id = generate_task_id();
      mirror_task(static_cast<NodeIndex>(i));
    }
  }
}

auto WorkflowRun::ref(NodeIndex idx) const -> NodeRef {
  return NodeRef{.id = step_node_id(id_, graph_.steps[idx].id),
                 .workflow_id = id_};
}

auto WorkflowRun::resolve_context() const -> ResolveContext {
  return ResolveContext{.steps = graph_.steps,
                        .context = graph_.workflow.context,
                        .evaluator = services_.evaluator};
}

auto WorkflowRun::transition(NodeIndex idx, NodeStatus from, NodeStatus to,
                             TransitionPayload payload, TimePoint now)
    -> Result<void> {
  auto &step = graph_.steps[idx];
  if (auto res = services_.states.transition(step.lifecycle, ref(idx), from, to,
                                             std::move(payload), now);
      !res) {
    return res;
  }
  if (from == NodeStatus::Running && to != NodeStatus::Paused) {
    release(idx);
  }
  if (to == NodeStatus::Completed) {
    graph_.workflow.results.get_object().insert_or_assign(
        step.id.str(), step.lifecycle.output_data);
  }
  mirror_task(idx);
  notify_step(idx);
  return ok();
}

auto WorkflowRun::complete(NodeIndex idx, JsonValue output, TimePoint now)
    -> Result<void> {
  return transition(idx, NodeStatus::Running, NodeStatus::Completed,
                    TransitionPayload{.output = std::move(output),
                                      .attempt = runtime_[idx].attempt},
                    now);
}

auto WorkflowRun::fail(NodeIndex idx, ErrorInfo error, bool retryable,
                       TimePoint now) -> Result<NodeStatus> {
  auto &lc = graph_.steps[idx].lifecycle;
  std::optional<Duration> delay;
  if (retryable) {
    delay = services_.retry.retry_delay(lc, graph_.workflow.retry_failed_steps);
  }
  auto res = services_.states.fail(lc, ref(idx), lc.status, std::move(error),
                                   delay, now);
  if (!res) {
    return res;
  }
  release(idx);
  mirror_task(idx);
  notify_step(idx);
  return res;
}

auto WorkflowRun::cancel(NodeIndex idx, ErrorInfo error, TimePoint now)
    -> Result<void> {
  auto &lc = graph_.steps[idx].lifecycle;
  if (auto res = services_.states.cancel(lc, ref(idx), std::move(error), now);
      !res) {
    return res;
  }
  release(idx);
  mirror_task(idx);
  notify_step(idx);
  return ok();
}

auto WorkflowRun::transition_workflow(WorkflowStatus to,
                                      std::string_view detail, TimePoint now)
    -> Result<void> {
  auto &wf = graph_.workflow;
  if (auto res = services_.states.transition(wf, wf.status, to, detail, now);
      !res) {
    return res;
  }
  notify_workflow();
  return ok();
}

auto WorkflowRun::cancel_all(ErrorKind kind, std::string_view message,
                             TimePoint now) -> void {
  for (NodeIndex i = 0; i < graph_.steps.size(); ++i) {
    if (is_terminal(graph_.steps[i].lifecycle.status)) {
      continue;
    }
    if (auto res = cancel(i,
                          ErrorInfo{.kind = kind,
                                    .message = std::string(message),
                                    .at = now},
                          now);
        !res) {
      log::warn("{}: could not cancel step {}: {}", id_, graph_.steps[i].id,
                res.error().message());
    }
  }
}

auto WorkflowRun::inside_loop(NodeIndex idx) const -> bool {
  auto parent = resolver_.parent_of(idx);
  return parent != kInvalidNode &&
         graph_.steps[parent].type() == StepType::Loop;
}

auto WorkflowRun::holds_slot(NodeIndex idx) const -> bool {
  return !is_container(graph_.steps[idx].type()) && !inside_loop(idx);
}

auto WorkflowRun::running_slots() const -> int {
  int n = 0;
  for (NodeIndex i = 0; i < graph_.steps.size(); ++i) {
    if (graph_.steps[i].lifecycle.status == NodeStatus::Running &&
        holds_slot(i)) {
      ++n;
    }
  }
  return n;
}

auto WorkflowRun::all_terminal() const -> bool {
  return std::ranges::all_of(graph_.steps, [](const WorkflowStep &s) {
    return is_terminal(s.lifecycle.status);
  });
}

auto WorkflowRun::finalize_if_done(TimePoint now) -> bool {
  auto &wf = graph_.workflow;
  if (is_terminal(wf.status)) {
    return true;
  }
  if (wf.status != WorkflowStatus::Running || !all_terminal()) {
    return false;
  }
  const bool success =
      std::ranges::all_of(graph_.steps, [](const WorkflowStep &s) {
        return s.lifecycle.status == NodeStatus::Completed ||
               is_skipped(s.lifecycle);
      });
  if (!success && !wf.root_cause) {
    wf.root_cause = find_root_cause();
  }
  std::string detail;
  if (wf.root_cause) {
    detail = std::format("root cause {}: {}", wf.root_cause->step_id,
                         wf.root_cause->error.message);
  }
  if (auto res = transition_workflow(
          success ? WorkflowStatus::Completed : WorkflowStatus::Failed, detail,
          now);
      !res) {
    log::error("{}: could not finalize: {}", id_, res.error().message());
    return false;
  }
  return true;
}

auto WorkflowRun::find_root_cause() const -> std::optional<RootCause> {
  const WorkflowStep *best = nullptr;
  for (const auto &step : graph_.steps) {
    const auto &lc = step.lifecycle;
    if (lc.status != NodeStatus::Failed && lc.status != NodeStatus::Cancelled) {
      continue;
    }
    if (!lc.error_info || lc.error_info->kind == ErrorKind::UpstreamFailed ||
        lc.error_info->kind == ErrorKind::Skipped) {
      continue;
    }
    if (best == nullptr ||
        lc.completed_at.value_or(TimePoint::max()) <
            best->lifecycle.completed_at.value_or(TimePoint::max())) {
      best = &step;
    }
  }
  if (best == nullptr) {
    return std::nullopt;
  }
  return RootCause{.step_id = best->id, .error = *best->lifecycle.error_info};
}

auto make_snapshot(const WorkflowGraph &graph,
                   std::span<const StepRuntime> runtime,
                   std::vector<AuditEntry> audit) -> WorkflowSnapshot {
  const auto &wf = graph.workflow;
  WorkflowSnapshot out{.id = wf.id,
                       .name = wf.name,
                       .status = wf.status,
                       .results = wf.results,
                       .root_cause = wf.root_cause,
                       .audit = std::move(audit),
                       .started_at = wf.started_at,
                       .completed_at = wf.completed_at};
  std::size_t terminal = 0;
  for (const auto &[i, step] : graph.steps | std::views::enumerate) {
    const auto &lc = step.lifecycle;
    terminal += is_terminal(lc.status) ? 1 : 0;
    const auto at = static_cast<std::size_t>(i);
    out.steps.push_back(StepSnapshot{
        .id = step.id,
        .name = step.name,
        .type = step.type(),
        .status = lc.status,
        .retry_count = lc.retry_count,
        .max_retries = lc.max_retries,
        .task_id = at < runtime.size() ? runtime[at].task_id : std::nullopt,
        .started_at = lc.started_at,
        .completed_at = lc.completed_at,
        .output = lc.output_data,
        .error = lc.error_info});
  }
  out.progress = graph.steps.empty()
                     ? 100.0
                     : 100.0 * static_cast<double>(terminal) /
                           static_cast<double>(graph.steps.size());
  return out;
}

auto WorkflowRun::snapshot() const -> WorkflowSnapshot {
  return make_snapshot(graph_, runtime_,
                       services_.states.store().audit_trail(id_));
}

auto WorkflowRun::release(NodeIndex idx) -> void {
  auto &rt = runtime_[idx];
  if (rt.admission) {
    if (auto res = services_.allocator.release(*rt.admission); !res) {
      log::error("{}: releasing admission of {} failed: {}", id_,
                 graph_.steps[idx].id, res.error().message());
    }
    rt.admission.reset();
  }
  if (auto signal = std::exchange(rt.cancel, nullptr)) {
    boost::asio::post(strand_, [signal] {
      signal->emit(boost::asio::cancellation_type::terminal);
    });
  }
}

auto WorkflowRun::mirror_task(NodeIndex idx) -> void {
  const auto &rt = runtime_[idx];
  if (!rt.task_id) {
    return;
  }
  const auto &step = graph_.steps[idx];
  const auto *cfg = std::get_if<TaskStepConfig>(&step.config);
  Task task{.id = *rt.task_id,
            .name = step.name,
            .task_type = cfg != nullptr ? cfg->task_type : std::string{},
            .priority = step.priority,
            .workflow_id = id_,
            .step_id = step.id,
            .input_data = cfg != nullptr ? cfg->input : JsonValue{},
            .execution_context = graph_.workflow.context,
            .resources = step.resources,
            .lifecycle = step.lifecycle};
  if (auto res = services_.states.store().save_task(task); !res) {
    log::error("{}: mirroring task {} failed: {}", id_, task.id,
               res.error().message());
  }
}

auto WorkflowRun::notify_step(NodeIndex idx) -> void {
  const auto &cb = services_.callbacks.on_step_status;
  if (!cb) {
    return;
  }
  boost::asio::post(services_.executor,
                    [cb, wf = id_, step = graph_.steps[idx].id,
                     status = graph_.steps[idx].lifecycle.status] {
                      cb(wf, step, status);
                    });
}

auto WorkflowRun::notify_workflow() -> void {
  const auto &cb = services_.callbacks.on_workflow_status;
  if (!cb) {
    return;
  }
  boost::asio::post(services_.executor,
                    [cb, wf = id_, status = graph_.workflow.status] {
                      cb(wf, status);
                    });
}

} // namespace flowcore
