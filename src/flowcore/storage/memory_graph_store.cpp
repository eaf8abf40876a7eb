#include "flowcore/storage/memory_graph_store.hpp"

#include "flowcore/util/log.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <ranges>

namespace flowcore {

auto MemoryGraphStore::save_graph(const WorkflowGraph &graph) -> Result<void> {
  if (graph.workflow.id.empty()) {
    return fail(Error::InvalidArgument);
  }
  std::scoped_lock lock(mu_);
  for (const auto &[i, step] : graph.steps | std::views::enumerate) {
    nodes_.insert_or_assign(step_node_id(graph.workflow.id, step.id).str(),
                            NodeRecord{.status = step.lifecycle.status,
                                       .workflow_id = graph.workflow.id,
                                       .step_index =
                                           static_cast<std::size_t>(i)});
  }
  graphs_.insert_or_assign(graph.workflow.id.str(), graph);
  append_audit_locked(AuditEntry{.at = Clock::now(),
                                 .workflow_id = graph.workflow.id,
                                 .to = std::string(
                                     to_string_view(graph.workflow.status)),
                                 .event = "graph_saved",
                                 .detail = std::format("{} steps, {} edges",
                                                       graph.steps.size(),
                                                       graph.dependencies
                                                           .size())});
  return ok();
}

auto MemoryGraphStore::load_graph(const WorkflowId &id) const
    -> Result<WorkflowGraph> {
  std::scoped_lock lock(mu_);
  auto it = graphs_.find(id.value());
  if (it == graphs_.end()) {
    return fail(Error::NotFound);
  }
  return ok(it->second);
}

auto MemoryGraphStore::save_transition(const NodeRef &node, NodeStatus from,
                                       NodeStatus to,
                                       const TransitionPayload &payload)
    -> Result<void> {
  std::scoped_lock lock(mu_);
  auto it = nodes_.find(node.id.value());
  if (it == nodes_.end()) {
    return fail(Error::NotFound);
  }
  auto &record = it->second;
  if (record.status != from) {
    log::info("stale transition on {}: expected {}, persisted {}", node.id,
              from, record.status);
    return fail(Error::Conflict);
  }
  record.status = to;

  NodeLifecycle *lc = nullptr;
  if (record.task_id) {
    if (auto t = tasks_.find(record.task_id->value()); t != tasks_.end()) {
      lc = &t->second.lifecycle;
    }
  } else if (auto g = graphs_.find(record.workflow_id.value());
             g != graphs_.end() && record.step_index < g->second.steps.size()) {
    lc = &g->second.steps[record.step_index].lifecycle;
  }
  if (lc != nullptr && payload.lifecycle) {
    *lc = *payload.lifecycle;
  } else if (lc != nullptr) {
    lc->status = to;
    if (payload.error) {
      lc->error_info = payload.error;
    }
    if (payload.output) {
      lc->output_data = *payload.output;
    }
  }

  std::string detail = payload.detail;
  if (detail.empty() && payload.error) {
    detail = std::format("{}: {}", payload.error->kind, payload.error->message);
  }
  append_audit_locked(AuditEntry{.at = Clock::now(),
                                 .workflow_id = node.workflow_id,
                                 .node_id = node.id,
                                 .from = std::string(to_string_view(from)),
                                 .to = std::string(to_string_view(to)),
                                 .event = "transition",
                                 .detail = std::move(detail)});
  return ok();
}

auto MemoryGraphStore::save_workflow_transition(const Workflow &next,
                                                WorkflowStatus from,
                                                std::string_view detail)
    -> Result<void> {
  std::scoped_lock lock(mu_);
  auto it = graphs_.find(next.id.value());
  if (it == graphs_.end()) {
    return fail(Error::NotFound);
  }
  auto &wf = it->second.workflow;
  if (wf.status != from) {
    log::info("stale workflow transition on {}: expected {}, persisted {}",
              next.id, from, wf.status);
    return fail(Error::Conflict);
  }
  wf = next;
  if (wf.updated_at == TimePoint{}) {
    wf.updated_at = Clock::now();
  }
  append_audit_locked(AuditEntry{.at = wf.updated_at,
                                 .workflow_id = next.id,
                                 .from = std::string(to_string_view(from)),
                                 .to = std::string(to_string_view(next.status)),
                                 .event = "workflow_transition",
                                 .detail = std::string(detail)});
  return ok();
}

auto MemoryGraphStore::node_status(const NodeId &id) const
    -> Result<NodeStatus> {
  std::scoped_lock lock(mu_);
  auto it = nodes_.find(id.value());
  if (it == nodes_.end()) {
    return fail(Error::NotFound);
  }
  return ok(it->second.status);
}

auto MemoryGraphStore::append_audit(AuditEntry entry) -> Result<void> {
  std::scoped_lock lock(mu_);
  append_audit_locked(std::move(entry));
  return ok();
}

auto MemoryGraphStore::append_audit_locked(AuditEntry entry) -> void {
  entry.seq = next_seq_++;
  if (entry.at == TimePoint{}) {
    entry.at = Clock::now();
  }
  audit_.push_back(std::move(entry));
}

auto MemoryGraphStore::audit_trail(const WorkflowId &id) const
    -> std::vector<AuditEntry> {
  std::scoped_lock lock(mu_);
  std::vector<AuditEntry> out;
  std::ranges::copy_if(audit_, std::back_inserter(out),
                       [&id](const AuditEntry &e) { return e.workflow_id == id; });
  return out;
}

auto MemoryGraphStore::audit_size() const -> std::size_t {
  std::scoped_lock lock(mu_);
  return audit_.size();
}

auto MemoryGraphStore::save_task(const Task &task) -> Result<void> {
  if (task.id.empty()) {
    return fail(Error::InvalidArgument);
  }
  if (task.lifecycle.retry_count > task.lifecycle.max_retries) {
    return fail(Error::InvalidArgument);
  }
  std::scoped_lock lock(mu_);
  if (auto idx = task_graph_.add_node(task.id.value()); !idx) {
    return fail(idx.error());
  }
  nodes_.insert_or_assign(task_node_id(task.id).str(),
                          NodeRecord{.status = task.lifecycle.status,
                                     .workflow_id =
                                         task.workflow_id.value_or(WorkflowId{}),
                                     .task_id = task.id});
  tasks_.insert_or_assign(task.id.str(), task);
  return ok();
}

auto MemoryGraphStore::load_task(const TaskId &id) const -> Result<Task> {
  std::scoped_lock lock(mu_);
  auto it = tasks_.find(id.value());
  if (it == tasks_.end()) {
    return fail(Error::NotFound);
  }
  return ok(it->second);
}

auto MemoryGraphStore::delete_task(const TaskId &id) -> Result<std::size_t> {
  std::scoped_lock lock(mu_);
  if (!tasks_.contains(id.value())) {
    return fail(Error::NotFound);
  }
  return ok(delete_task_locked(id));
}

auto MemoryGraphStore::delete_task_locked(const TaskId &id) -> std::size_t {
  std::vector<TaskId> children;
  for (const auto &[key, task] : tasks_) {
    if (task.parent_task_id == id) {
      children.push_back(task.id);
    }
  }
  std::size_t removed = 0;
  for (const auto &child : children) {
    removed += delete_task_locked(child);
  }

  std::erase_if(task_deps_, [&id](const TaskDependency &d) {
    return d.task_id == id || d.depends_on == id;
  });
  if (auto idx = task_graph_.index_of(id.value()); idx != kInvalidNode) {
    (void)task_graph_.remove_node_edges(idx);
  }
  nodes_.erase(task_node_id(id).str());
  removed += tasks_.erase(id.str());
  return removed;
}

auto MemoryGraphStore::add_task_dependency(const TaskDependency &dep)
    -> Result<void> {
  std::scoped_lock lock(mu_);
  if (!tasks_.contains(dep.task_id.value()) ||
      !tasks_.contains(dep.depends_on.value())) {
    return fail(Error::MissingReference);
  }
  auto edge = task_graph_.add_edge(dep.depends_on.value(), dep.task_id.value());
  if (!edge) {
    log::warn("rejecting task dependency {} -> {}: {}", dep.depends_on,
              dep.task_id, edge.error().message());
    return fail(edge.error());
  }
  task_deps_.push_back(dep);
  return ok();
}

auto MemoryGraphStore::task_dependencies(const TaskId &id) const
    -> std::vector<TaskDependency> {
  std::scoped_lock lock(mu_);
  std::vector<TaskDependency> out;
  std::ranges::copy_if(task_deps_, std::back_inserter(out),
                       [&id](const TaskDependency &d) { return d.task_id == id; });
  return out;
}

auto MemoryGraphStore::tasks_of(const WorkflowId &id) const
    -> std::vector<Task> {
  std::scoped_lock lock(mu_);
  std::vector<Task> out;
  for (const auto &[key, task] : tasks_) {
    if (task.workflow_id == id) {
      out.push_back(task);
    }
  }
  return out;
}

} // namespace flowcore
