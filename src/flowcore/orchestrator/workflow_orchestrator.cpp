#include "flowcore/orchestrator/workflow_orchestrator.hpp"

#include "flowcore/orchestrator/workflow_validator.hpp"
#include "flowcore/util/log.hpp"

#include <algorithm>
#include <format>
#include <optional>

namespace flowcore {

WorkflowOrchestrator::WorkflowOrchestrator(boost::asio::io_context &io,
                                           GraphStore &store,
                                           const RunnerRegistry &runners,
                                           OrchestratorOptions options)
    : store_(store),
      evaluator_(options.evaluator
                     ? std::move(options.evaluator)
                     : std::make_shared<ComparisonPredicateEvaluator>()),
      states_(store), allocator_(std::move(options.budget)),
      retry_(options.retry),
      services_{.executor = io.get_executor(),
                .states = states_,
                .allocator = allocator_,
                .retry = retry_,
                .runners = runners,
                .evaluator = *evaluator_,
                .callbacks = callbacks_,
                .wake = [this] { scheduler_.wake(); }},
      tasks_(std::make_shared<TaskPool>(services_)),
      scheduler_(io, services_, executor_, tasks_, options.tick_interval) {}

WorkflowOrchestrator::~WorkflowOrchestrator() { stop(); }

auto WorkflowOrchestrator::start() -> void { scheduler_.start(); }

auto WorkflowOrchestrator::stop() -> void { scheduler_.stop(); }

auto WorkflowOrchestrator::set_callbacks(StatusCallbacks callbacks) -> void {
  callbacks_ = std::move(callbacks);
}

auto WorkflowOrchestrator::find_run(const WorkflowId &id) const
    -> std::shared_ptr<WorkflowRun> {
  return scheduler_.find(id);
}

// Finished runs linger until the next scheduler pass drops them; webhook
// calls treat them as already gone.
auto WorkflowOrchestrator::find_live_run(const WorkflowId &id) const
    -> std::shared_ptr<WorkflowRun> {
  auto run = find_run(id);
  if (!run) {
    return nullptr;
  }
  std::scoped_lock lock(run->mutex());
  return is_terminal(run->workflow().status) ? nullptr : run;
}

auto WorkflowOrchestrator::create_workflow(WorkflowGraph graph)
    -> Result<WorkflowId> {
  auto &wf = graph.workflow;
  if (wf.id.empty()) {
    wf.id = generate_workflow_id();
  } else if (store_.load_graph(wf.id)) {
    log::warn("workflow {} already exists", wf.id);
    return fail(Error::DuplicateId);
  }
  if (wf.status != WorkflowStatus::Draft) {
    return fail(Error::InvalidState);
  }
  if (auto res = validate_workflow(graph); !res) {
    return fail(res.error());
  }

  const auto now = Clock::now();
  wf.created_at = now;
  wf.updated_at = now;
  for (auto &step : graph.steps) {
    step.lifecycle.created_at = now;
    step.lifecycle.updated_at = now;
  }
  if (!wf.results.is_object()) {
    wf.results = make_json_object();
  }
  if (wf.context.is_null()) {
    wf.context = make_json_object();
  }

  if (auto res = store_.save_graph(graph); !res) {
    log::error("persisting workflow {} failed: {}", wf.id,
               res.error().message());
    return fail(res.error());
  }
  if (auto res = states_.transition(wf, WorkflowStatus::Draft,
                                    WorkflowStatus::Ready, "validated", now);
      !res) {
    return fail(res.error());
  }
  log::info("created workflow {} '{}' with {} steps", wf.id, wf.name,
            graph.steps.size());
  return ok(wf.id);
}

auto WorkflowOrchestrator::start_workflow(const WorkflowId &id)
    -> Result<void> {
  if (find_run(id)) {
    return fail(Error::InvalidState);
  }
  auto graph = store_.load_graph(id);
  if (!graph) {
    return fail(graph.error());
  }
  if (graph->workflow.status != WorkflowStatus::Ready) {
    log::warn("workflow {} cannot start from {}", id, graph->workflow.status);
    return fail(Error::InvalidState);
  }
  auto resolver = DependencyResolver::from_graph(*graph);
  if (!resolver) {
    return fail(resolver.error());
  }

  auto run = std::make_shared<WorkflowRun>(
      std::move(*graph), std::move(*resolver), services_, next_seq_++);
  {
    std::scoped_lock lock(run->mutex());
    if (auto res = run->transition_workflow(WorkflowStatus::Running, "started");
        !res) {
      return res;
    }
  }
  scheduler_.add(run);
  scheduler_.start();
  scheduler_.wake();
  return ok();
}

auto WorkflowOrchestrator::pause_workflow(const WorkflowId &id)
    -> Result<void> {
  auto run = find_run(id);
  if (!run) {
    return fail(store_.load_graph(id) ? Error::InvalidState : Error::NotFound);
  }
  std::scoped_lock lock(run->mutex());
  const auto now = Clock::now();
  if (auto res = run->transition_workflow(WorkflowStatus::Paused, "paused", now);
      !res) {
    return res;
  }
  for (NodeIndex i = 0; i < run->size(); ++i) {
    const auto &step = run->step(i);
    if (step.type() != StepType::Wait ||
        step.lifecycle.status != NodeStatus::Running) {
      continue;
    }
    if (run->transition(i, NodeStatus::Running, NodeStatus::Paused,
                        TransitionPayload{.detail = "workflow paused"}, now)) {
      run->runtime(i).paused_at = now;
    }
  }
  return ok();
}

auto WorkflowOrchestrator::resume_workflow(const WorkflowId &id)
    -> Result<void> {
  auto run = find_run(id);
  if (!run) {
    return fail(store_.load_graph(id) ? Error::InvalidState : Error::NotFound);
  }
  {
    std::scoped_lock lock(run->mutex());
    const auto now = Clock::now();
    if (run->workflow().status != WorkflowStatus::Paused) {
      return fail(Error::InvalidState);
    }
    for (NodeIndex i = 0; i < run->size(); ++i) {
      if (run->step(i).lifecycle.status != NodeStatus::Paused) {
        continue;
      }
      auto &rt = run->runtime(i);
      if (run->transition(i, NodeStatus::Paused, NodeStatus::Running,
                          TransitionPayload{.detail = "workflow resumed",
                                            .attempt = rt.attempt},
                          now)) {
        if (rt.paused_at) {
          rt.paused_total +=
              std::chrono::duration_cast<Duration>(now - *rt.paused_at);
          rt.paused_at.reset();
        }
      }
    }
    if (auto res =
            run->transition_workflow(WorkflowStatus::Running, "resumed", now);
        !res) {
      return res;
    }
  }
  scheduler_.wake();
  return ok();
}

auto WorkflowOrchestrator::cancel_workflow(const WorkflowId &id)
    -> Result<void> {
  auto run = find_run(id);
  if (!run) {
    // Created but never started.
    auto graph = store_.load_graph(id);
    if (!graph) {
      return fail(graph.error());
    }
    return states_.transition(graph->workflow, graph->workflow.status,
                              WorkflowStatus::Cancelled, "cancelled");
  }
  {
    std::scoped_lock lock(run->mutex());
    if (is_terminal(run->workflow().status)) {
      return fail(Error::InvalidState);
    }
    const auto now = Clock::now();
    run->cancel_all(ErrorKind::Cancelled, "workflow cancelled", now);
    if (auto res = run->transition_workflow(WorkflowStatus::Cancelled,
                                            "cancelled", now);
        !res) {
      return res;
    }
  }
  scheduler_.wake();
  return ok();
}

auto WorkflowOrchestrator::get_status(const WorkflowId &id) const
    -> Result<WorkflowSnapshot> {
  if (auto run = find_run(id)) {
    std::scoped_lock lock(run->mutex());
    return ok(run->snapshot());
  }
  auto graph = store_.load_graph(id);
  if (!graph) {
    return fail(graph.error());
  }
  auto snap = make_snapshot(*graph, {}, store_.audit_trail(id));
  for (const auto &task : store_.tasks_of(id)) {
    auto it = std::ranges::find_if(snap.steps, [&task](const StepSnapshot &s) {
      return task.step_id == s.id;
    });
    if (it != snap.steps.end()) {
      it->task_id = task.id;
    }
  }
  return ok(std::move(snap));
}

auto WorkflowOrchestrator::get_task_status(const TaskId &id) const
    -> Result<Task> {
  return store_.load_task(id);
}

auto WorkflowOrchestrator::pooled_task(const TaskId &id) -> Result<NodeIndex> {
  if (auto idx = tasks_->index_of(id); idx != kInvalidNode) {
    return ok(idx);
  }
  auto task = store_.load_task(id);
  if (!task) {
    return fail(Error::MissingReference);
  }
  if (task->workflow_id) {
    log::warn("task {} belongs to workflow {}", id, *task->workflow_id);
    return fail(Error::InvalidArgument);
  }
  return tasks_->add(std::move(*task), next_seq_++);
}

auto WorkflowOrchestrator::submit_task(Task task) -> Result<TaskId> {
  if (task.workflow_id) {
    return fail(Error::InvalidArgument);
  }
  if (task.id.empty()) {
    task.id = generate_task_id();
  } else if (store_.load_task(task.id)) {
    log::warn("task {} already exists", task.id);
    return fail(Error::DuplicateId);
  }
  if (task.lifecycle.status != NodeStatus::Pending) {
    return fail(Error::InvalidState);
  }
  if (task.priority < node_defaults::kMinPriority ||
      task.priority > node_defaults::kMaxPriority || task.task_type.empty()) {
    return fail(Error::InvalidArgument);
  }
  const auto now = Clock::now();
  task.lifecycle.created_at = now;
  task.lifecycle.updated_at = now;
  if (task.execution_context.is_null()) {
    task.execution_context = make_json_object();
  }

  {
    std::scoped_lock lock(tasks_->mutex());
    std::optional<NodeIndex> parent;
    if (task.parent_task_id) {
      auto idx = pooled_task(*task.parent_task_id);
      if (!idx) {
        return fail(idx.error());
      }
      parent = *idx;
    }
    if (auto res = store_.save_task(task); !res) {
      log::error("persisting task {} failed: {}", task.id,
                 res.error().message());
      return fail(res.error());
    }
    auto idx = tasks_->add(task, next_seq_++);
    if (!idx) {
      if (auto undo = store_.delete_task(task.id); !undo) {
        log::error("removing unscheduled task {} failed: {}", task.id,
                   undo.error().message());
      }
      return fail(idx.error());
    }
    if (parent) {
      const TaskDependency on_parent{.task_id = task.id,
                                     .depends_on = *task.parent_task_id};
      auto res = store_.add_task_dependency(on_parent);
      if (res) {
        res = tasks_->add_dependency(on_parent);
      }
      if (!res) {
        log::error("linking task {} to parent {} failed: {}", task.id,
                   *task.parent_task_id, res.error().message());
        if (auto undo = tasks_->cancel(
                *idx, ErrorInfo{.kind = ErrorKind::Cancelled,
                                .message = "parent link failed"});
            !undo) {
          log::error("cancelling unlinked task {} failed: {}", task.id,
                     undo.error().message());
        }
        return fail(res.error());
      }
    }
  }
  log::info("submitted task {} '{}' ({})", task.id, task.name, task.task_type);
  scheduler_.start();
  scheduler_.wake();
  return ok(task.id);
}

auto WorkflowOrchestrator::add_task_dependency(const TaskDependency &dep)
    -> Result<void> {
  {
    std::scoped_lock lock(tasks_->mutex());
    auto down = pooled_task(dep.task_id);
    if (!down) {
      return fail(down.error());
    }
    if (tasks_->task(*down).lifecycle.status != NodeStatus::Pending) {
      log::warn("task {} is {}; dependencies can no longer change",
                dep.task_id, tasks_->task(*down).lifecycle.status);
      return fail(Error::InvalidState);
    }
    if (auto up = pooled_task(dep.depends_on); !up) {
      return fail(up.error());
    }
    if (auto res = store_.add_task_dependency(dep); !res) {
      return res;
    }
    if (auto res = tasks_->add_dependency(dep); !res) {
      log::error("task dependency {} -> {} persisted but not scheduled: {}",
                 dep.depends_on, dep.task_id, res.error().message());
      return res;
    }
  }
  scheduler_.wake();
  return ok();
}

auto WorkflowOrchestrator::cancel_task(const TaskId &id) -> Result<void> {
  {
    std::scoped_lock lock(tasks_->mutex());
    const auto idx = tasks_->index_of(id);
    if (idx == kInvalidNode) {
      return fail(store_.load_task(id) ? Error::InvalidState : Error::NotFound);
    }
    if (is_terminal(tasks_->task(idx).lifecycle.status)) {
      return fail(Error::InvalidState);
    }
    if (auto res = tasks_->cancel(idx,
                                  ErrorInfo{.kind = ErrorKind::Cancelled,
                                            .message = "task cancelled"});
        !res) {
      return res;
    }
  }
  scheduler_.wake();
  return ok();
}

auto WorkflowOrchestrator::list_active_workflows() const
    -> std::vector<WorkflowId> {
  return scheduler_.active();
}

auto WorkflowOrchestrator::complete_webhook(const WorkflowId &id,
                                            const StepId &step,
                                            JsonValue output) -> Result<void> {
  auto run = find_live_run(id);
  if (!run) {
    return fail(Error::NotFound);
  }
  return executor_.complete_webhook(*run, step, std::move(output));
}

auto WorkflowOrchestrator::fail_webhook(const WorkflowId &id,
                                        const StepId &step,
                                        std::string message) -> Result<void> {
  auto run = find_live_run(id);
  if (!run) {
    return fail(Error::NotFound);
  }
  return executor_.fail_webhook(*run, step, std::move(message));
}

} // namespace flowcore
