#include "flowcore/orchestrator/workflow_validator.hpp"

#include "flowcore/graph/dependency_resolver.hpp"
#include "flowcore/util/log.hpp"
#include "flowcore/util/string_hash.hpp"

#include <algorithm>
#include <format>
#include <variant>

namespace flowcore {

namespace {

class IssueCollector {
public:
  explicit IssueCollector(const WorkflowGraph &graph) : graph_(graph) {
    for (const auto &step : graph_.steps) {
      ids_.insert(step.id.str());
    }
  }

  auto run() -> std::vector<ValidationIssue> {
    check_workflow();
    check_ids();
    for (const auto &step : graph_.steps) {
      check_lifecycle(step);
      std::visit([&](const auto &cfg) { check_config(step, cfg); },
                 step.config);
    }
    check_dependencies();
    if (issues_.empty()) {
      check_graph();
    }
    return std::move(issues_);
  }

private:
  auto add(Error code, const StepId &step, std::string message) -> void {
    issues_.push_back(ValidationIssue{
        .code = code, .step = step, .message = std::move(message)});
  }

  auto check_refs(const WorkflowStep &step, const std::vector<StepId> &refs,
                  std::string_view what) -> void {
    for (const auto &ref : refs) {
      if (!ids_.contains(ref.str())) {
        add(Error::MissingReference, step.id,
            std::format("{} references unknown step '{}'", what, ref));
      } else if (ref == step.id) {
        add(Error::InvalidArgument, step.id,
            std::format("{} references the step itself", what));
      }
    }
  }

  auto check_workflow() -> void {
    const auto &wf = graph_.workflow;
    if (wf.max_parallel_steps < 1) {
      add(Error::InvalidArgument, {},
          std::format("max_parallel_steps must be >= 1, got {}",
                      wf.max_parallel_steps));
    }
    if (wf.timeout.count() < 0) {
      add(Error::InvalidArgument, {}, "timeout must not be negative");
    }
    if (!wf.context.is_null() && !wf.context.is_object()) {
      add(Error::InvalidArgument, {}, "context must be an object");
    }
  }

  auto check_ids() -> void {
    StringSet seen;
    for (const auto &step : graph_.steps) {
      if (step.id.empty()) {
        add(Error::InvalidArgument, {}, "step with empty id");
      } else if (!seen.insert(step.id.str()).second) {
        add(Error::DuplicateId, step.id, "duplicate step id");
      }
    }
  }

  auto check_lifecycle(const WorkflowStep &step) -> void {
    if (step.priority < node_defaults::kMinPriority ||
        step.priority > node_defaults::kMaxPriority) {
      add(Error::InvalidArgument, step.id,
          std::format("priority {} outside [{}, {}]", step.priority,
                      node_defaults::kMinPriority,
                      node_defaults::kMaxPriority));
    }
    const auto &lc = step.lifecycle;
    if (lc.max_retries < 0) {
      add(Error::InvalidArgument, step.id, "max_retries must be >= 0");
    }
    if (lc.timeout.count() < 0) {
      add(Error::InvalidArgument, step.id, "timeout must not be negative");
    }
    if (lc.status != NodeStatus::Pending) {
      add(Error::InvalidArgument, step.id,
          std::format("new steps must be pending, got {}", lc.status));
    }
  }

  auto check_config(const WorkflowStep &step, const TaskStepConfig &cfg)
      -> void {
    if (cfg.task_type.empty()) {
      add(Error::InvalidArgument, step.id, "task step without task_type");
    }
  }

  auto check_config(const WorkflowStep &step, const CustomStepConfig &cfg)
      -> void {
    if (cfg.handler.empty()) {
      add(Error::InvalidArgument, step.id, "custom step without handler");
    }
  }

  auto check_config(const WorkflowStep &step, const ConditionStepConfig &cfg)
      -> void {
    if (cfg.predicate.empty()) {
      add(Error::InvalidArgument, step.id, "condition without predicate");
    }
    check_refs(step, cfg.true_path_steps, "true path");
    check_refs(step, cfg.false_path_steps, "false path");
    for (const auto &id : cfg.true_path_steps) {
      if (std::ranges::contains(cfg.false_path_steps, id)) {
        add(Error::InvalidArgument, step.id,
            std::format("step '{}' is on both branches", id));
      }
    }
  }

  auto check_config(const WorkflowStep &step, const ParallelStepConfig &cfg)
      -> void {
    check_refs(step, cfg.child_step_ids, "parallel child");
  }

  auto check_config(const WorkflowStep &step, const SequentialStepConfig &cfg)
      -> void {
    check_refs(step, cfg.child_step_ids, "sequential child");
  }

  auto check_config(const WorkflowStep &step, const LoopStepConfig &cfg)
      -> void {
    if (cfg.predicate.empty()) {
      add(Error::InvalidArgument, step.id, "loop without predicate");
    }
    if (cfg.max_iterations < 1) {
      add(Error::InvalidArgument, step.id, "max_iterations must be >= 1");
    }
    if (cfg.body_step_ids.empty()) {
      add(Error::InvalidArgument, step.id, "loop without body steps");
    }
    check_refs(step, cfg.body_step_ids, "loop body");
    for (const auto &id : cfg.body_step_ids) {
      const auto *body = graph_.find_step(id);
      if (body == nullptr) {
        continue;
      }
      if (body->type() != StepType::Task && body->type() != StepType::Custom) {
        add(Error::InvalidArgument, step.id,
            std::format("loop body '{}' must be a task or custom step", id));
      }
      const bool has_deps =
          std::ranges::any_of(graph_.dependencies, [&id](const auto &d) {
            return d.step_id == id;
          });
      if (has_deps) {
        add(Error::InvalidArgument, step.id,
            std::format("loop body '{}' must not declare dependencies", id));
      }
    }
  }

  auto check_config(const WorkflowStep &step, const WaitStepConfig &cfg)
      -> void {
    if (!cfg.duration && cfg.condition.empty()) {
      add(Error::InvalidArgument, step.id,
          "wait step needs a duration or a condition");
    }
    if (cfg.duration && cfg.duration->count() < 0) {
      add(Error::InvalidArgument, step.id, "wait duration is negative");
    }
  }

  auto check_config(const WorkflowStep &step, const WebhookStepConfig &cfg)
      -> void {
    if (cfg.event.empty()) {
      add(Error::InvalidArgument, step.id, "webhook step without event");
    }
  }

  auto check_dependencies() -> void {
    for (const auto &dep : graph_.dependencies) {
      if (!ids_.contains(dep.step_id.str())) {
        add(Error::MissingReference, dep.step_id, "dependency of unknown step");
      }
      if (!ids_.contains(dep.depends_on.str())) {
        add(Error::MissingReference, dep.step_id,
            std::format("depends on unknown step '{}'", dep.depends_on));
      }
      if (dep.step_id == dep.depends_on) {
        add(Error::CycleDetected, dep.step_id, "step depends on itself");
      }
      if (dep.type == DependencyType::Conditional &&
          dep.condition_expression.empty()) {
        add(Error::InvalidArgument, dep.step_id,
            std::format("conditional edge from '{}' without expression",
                        dep.depends_on));
      }
    }
  }

  // Builds the resolver to catch cycles and double membership.
  auto check_graph() -> void {
    if (auto resolver = DependencyResolver::from_graph(graph_); !resolver) {
      add(static_cast<Error>(resolver.error().value()), {},
          resolver.error().message());
    }
  }

  const WorkflowGraph &graph_;
  StringSet ids_;
  std::vector<ValidationIssue> issues_;
};

} // namespace

auto collect_issues(const WorkflowGraph &graph)
    -> std::vector<ValidationIssue> {
  return IssueCollector(graph).run();
}

auto validate_workflow(const WorkflowGraph &graph) -> Result<void> {
  auto issues = collect_issues(graph);
  if (issues.empty()) {
    return ok();
  }
  for (const auto &issue : issues) {
    if (issue.step.empty()) {
      log::warn("workflow {}: {}", graph.workflow.id, issue.message);
    } else {
      log::warn("workflow {} step {}: {}", graph.workflow.id, issue.step,
                issue.message);
    }
  }
  return fail(issues.front().code);
}

} // namespace flowcore
