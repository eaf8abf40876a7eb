#include "flowcore/graph/dependency_resolver.hpp"

#include "flowcore/util/log.hpp"

#include <algorithm>
#include <ranges>

namespace flowcore {

auto is_skipped(const NodeLifecycle &lc) noexcept -> bool {
  return lc.status == NodeStatus::Cancelled && lc.error_info &&
         lc.error_info->kind == ErrorKind::Skipped;
}

auto make_evaluation_context(std::span<const WorkflowStep> steps,
                             const JsonValue &context) -> JsonValue {
  JsonValue out = context.is_object() ? context : make_json_object();
  auto outputs = make_json_object();
  for (const auto &step : steps) {
    if (step.lifecycle.status == NodeStatus::Completed) {
      outputs.get_object().insert_or_assign(step.id.str(),
                                            step.lifecycle.output_data);
    }
  }
  out.get_object().insert_or_assign("steps", std::move(outputs));
  return out;
}

auto make_task_evaluation_context(std::span<const Task> tasks) -> JsonValue {
  auto outputs = make_json_object();
  for (const auto &task : tasks) {
    if (task.lifecycle.status == NodeStatus::Completed) {
      outputs.get_object().insert_or_assign(task.id.str(),
                                            task.lifecycle.output_data);
    }
  }
  auto out = make_json_object();
  out.get_object().insert_or_assign("tasks", std::move(outputs));
  return out;
}

auto DependencyResolver::from_graph(const WorkflowGraph &graph)
    -> Result<DependencyResolver> {
  DependencyResolver r;
  r.parent_.assign(graph.steps.size(), kInvalidNode);

  for (const auto &step : graph.steps) {
    if (r.graph_.has_node(step.id.value())) {
      log::warn("duplicate step id '{}'", step.id);
      return fail(Error::DuplicateId);
    }
    if (auto idx = r.graph_.add_node(step.id.value()); !idx) {
      return fail(idx.error());
    }
  }

  auto lookup = [&r](const StepId &id) -> Result<NodeIndex> {
    auto idx = r.graph_.index_of(id.value());
    if (idx == kInvalidNode) {
      log::warn("reference to unknown step '{}'", id);
      return fail(Error::MissingReference);
    }
    return ok(idx);
  };

  for (const auto &dep : graph.dependencies) {
    auto from = lookup(dep.depends_on);
    auto to = lookup(dep.step_id);
    if (!from) {
      return fail(from.error());
    }
    if (!to) {
      return fail(to.error());
    }
    if (auto res = r.add_edge(*from, *to,
                              EdgeInfo{.type = dep.type,
                                       .optional = dep.optional,
                                       .condition = dep.condition_expression},
                              false);
        !res) {
      return fail(res.error());
    }
  }

  for (const auto &[i, step] : graph.steps | std::views::enumerate) {
    const auto self = static_cast<NodeIndex>(i);

    auto link_children = [&](std::span<const StepId> children,
                             EdgeRole role) -> Result<void> {
      for (const auto &child_id : children) {
        auto child = lookup(child_id);
        if (!child) {
          return fail(child.error());
        }
        if (auto res = r.set_parent(*child, self); !res) {
          return res;
        }
        if (auto res = r.add_edge(self, *child, EdgeInfo{.role = role}, true);
            !res) {
          return res;
        }
      }
      return ok();
    };

    Result<void> res = ok();
    if (const auto *cond = std::get_if<ConditionStepConfig>(&step.config)) {
      for (const auto *path : {&cond->true_path_steps, &cond->false_path_steps}) {
        for (const auto &target_id : *path) {
          auto target = lookup(target_id);
          if (!target) {
            return fail(target.error());
          }
          res = r.add_edge(self, *target, EdgeInfo{}, true);
          if (!res) {
            return fail(res.error());
          }
        }
      }
    } else if (const auto *par =
                   std::get_if<ParallelStepConfig>(&step.config)) {
      res = link_children(par->child_step_ids, EdgeRole::Containment);
    } else if (const auto *seq =
                   std::get_if<SequentialStepConfig>(&step.config)) {
      res = link_children(seq->child_step_ids, EdgeRole::Containment);
      if (res) {
        std::vector<NodeIndex> chain;
        for (const auto &child_id : seq->child_step_ids) {
          chain.push_back(r.graph_.index_of(child_id.value()));
        }
        std::ranges::stable_sort(chain, {}, [&graph](NodeIndex n) {
          return graph.steps[n].step_order;
        });
        for (std::size_t k = 1; k < chain.size() && res; ++k) {
          res = r.add_edge(chain[k - 1], chain[k], EdgeInfo{}, true);
        }
      }
    } else if (const auto *loop = std::get_if<LoopStepConfig>(&step.config)) {
      res = link_children(loop->body_step_ids, EdgeRole::LoopBody);
    }
    if (!res) {
      return fail(res.error());
    }
  }

  return ok(std::move(r));
}

auto DependencyResolver::add_edge(NodeIndex upstream, NodeIndex downstream,
                                  EdgeInfo info, bool implicit)
    -> Result<void> {
  if (implicit && graph_.has_edge(upstream, downstream)) {
    return ok();
  }
  auto edge = graph_.add_edge(upstream, downstream);
  if (!edge) {
    log::warn("rejecting edge {} -> {}: {}", graph_.key_of(upstream),
              graph_.key_of(downstream), edge.error().message());
    return fail(edge.error());
  }
  if (*edge >= edges_.size()) {
    edges_.resize(*edge + 1);
  }
  edges_[*edge] = std::move(info);
  return ok();
}

auto DependencyResolver::add_node(std::string_view key) -> Result<NodeIndex> {
  auto idx = graph_.add_node(key);
  if (!idx) {
    return fail(idx.error());
  }
  if (*idx >= parent_.size()) {
    parent_.resize(*idx + 1, kInvalidNode);
  }
  return idx;
}

auto DependencyResolver::add_dependency(NodeIndex upstream,
                                        NodeIndex downstream, EdgeInfo info)
    -> Result<void> {
  info.role = EdgeRole::Dependency;
  return add_edge(upstream, downstream, std::move(info), false);
}

auto DependencyResolver::set_parent(NodeIndex child, NodeIndex parent)
    -> Result<void> {
  if (parent_[child] != kInvalidNode && parent_[child] != parent) {
    log::warn("step '{}' is owned by both '{}' and '{}'", graph_.key_of(child),
              graph_.key_of(parent_[child]), graph_.key_of(parent));
    return fail(Error::InvalidArgument);
  }
  parent_[child] = parent;
  return ok();
}

auto DependencyResolver::evaluate(NodeIndex idx,
                                  const ResolveContext &ctx) const
    -> Readiness {
  std::vector<NodeView> view;
  view.reserve(ctx.steps.size());
  for (const auto &step : ctx.steps) {
    view.push_back(view_of(step.lifecycle));
  }
  const auto eval_ctx = make_evaluation_context(ctx.steps, ctx.context);
  return evaluate_view(idx, ctx.evaluator, view, eval_ctx);
}

auto DependencyResolver::evaluate_view(NodeIndex idx,
                                       const PredicateEvaluator &evaluator,
                                       std::span<const NodeView> view,
                                       const JsonValue &eval_ctx) const
    -> Readiness {
  bool waiting = false;
  std::size_t satisfied = 0;
  std::size_t skipped = 0;

  for (const auto &adj : graph_.deps(idx)) {
    const auto &info = edges_[adj.edge];
    const auto &up = view[adj.node];

    if (info.role != EdgeRole::Dependency) {
      if (is_terminal(up.status)) {
        // A container only finishes once its children are terminal, so a
        // terminal parent here was cancelled or failed before they ran.
        return up.skipped ? Readiness::Skip : Readiness::Cancel;
      }
      if (info.role == EdgeRole::LoopBody || up.status != NodeStatus::Running) {
        waiting = true;
      }
      continue;
    }

    if (up.status == NodeStatus::Completed) {
      const auto &output = *up.output;
      bool ok_edge = true;
      if (info.type == DependencyType::Data) {
        ok_edge = !output.is_null();
      } else if (info.type == DependencyType::Conditional &&
                 !info.condition.empty()) {
        auto local = eval_ctx;
        local.get_object().insert_or_assign("upstream", output);
        auto verdict = evaluator.evaluate(info.condition, local);
        ok_edge = verdict.has_value() && *verdict;
      }
      if (ok_edge || info.optional) {
        ++satisfied;
      } else {
        return Readiness::Cancel;
      }
    } else if (up.skipped) {
      ++skipped;
    } else if (up.status == NodeStatus::Failed ||
               up.status == NodeStatus::Cancelled) {
      if (!info.optional) {
        return Readiness::Cancel;
      }
      ++satisfied;
    } else {
      waiting = true;
    }
  }

  if (waiting) {
    return Readiness::Waiting;
  }
  if (skipped > 0 && satisfied == 0) {
    return Readiness::Skip;
  }
  return Readiness::Ready;
}

auto DependencyResolver::resolve(const ResolveContext &ctx) const
    -> Resolution {
  std::vector<NodeView> view;
  view.reserve(ctx.steps.size());
  for (const auto &step : ctx.steps) {
    view.push_back(view_of(step.lifecycle));
  }
  return resolve_view(std::move(view), ctx.evaluator,
                      make_evaluation_context(ctx.steps, ctx.context));
}

auto DependencyResolver::resolve(const TaskResolveContext &ctx) const
    -> Resolution {
  std::vector<NodeView> view;
  view.reserve(ctx.tasks.size());
  for (const auto &task : ctx.tasks) {
    view.push_back(view_of(task.lifecycle));
  }
  return resolve_view(std::move(view), ctx.evaluator,
                      make_task_evaluation_context(ctx.tasks));
}

auto DependencyResolver::resolve_view(std::vector<NodeView> view,
                                      const PredicateEvaluator &evaluator,
                                      const JsonValue &eval_ctx) const
    -> Resolution {
  Resolution out;
  for (auto idx : graph_.topological_order()) {
    if (view[idx].status != NodeStatus::Pending) {
      continue;
    }
    switch (evaluate_view(idx, evaluator, view, eval_ctx)) {
    case Readiness::Ready:
      out.ready.push_back(idx);
      break;
    case Readiness::Cancel:
      view[idx].status = NodeStatus::Cancelled;
      out.cancelled.push_back(idx);
      break;
    case Readiness::Skip:
      view[idx].status = NodeStatus::Cancelled;
      view[idx].skipped = true;
      out.skipped.push_back(idx);
      break;
    case Readiness::Waiting:
      break;
    }
  }
  return out;
}

auto DependencyResolver::ready_set(const ResolveContext &ctx) const
    -> std::vector<NodeIndex> {
  auto resolution = resolve(ctx);
  auto out = std::move(resolution.ready);
  for (const auto &[i, step] : ctx.steps | std::views::enumerate) {
    if (step.lifecycle.status == NodeStatus::Queued) {
      out.push_back(static_cast<NodeIndex>(i));
    }
  }
  return out;
}

auto DependencyResolver::children_of(NodeIndex idx) const
    -> std::vector<NodeIndex> {
  std::vector<NodeIndex> out;
  for (const auto &adj : graph_.dependents(idx)) {
    if (edges_[adj.edge].role != EdgeRole::Dependency) {
      out.push_back(adj.node);
    }
  }
  return out;
}

auto DependencyResolver::upstream_of(NodeIndex idx) const
    -> std::vector<NodeIndex> {
  std::vector<NodeIndex> out;
  for (const auto &adj : graph_.deps(idx)) {
    if (edges_[adj.edge].role == EdgeRole::Dependency) {
      out.push_back(adj.node);
    }
  }
  return out;
}

} // namespace flowcore
