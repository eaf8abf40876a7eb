#pragma once

#include "flowcore/model/node.hpp"
#include "flowcore/model/status.hpp"
#include "flowcore/util/id.hpp"
#include "flowcore/util/json.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace flowcore {

struct TaskStepConfig {
  std::string task_type;
  JsonValue task_config{};
  JsonValue input{};
};

struct CustomStepConfig {
  std::string handler;
  JsonValue config{};
  JsonValue input{};
};

struct ConditionStepConfig {
  std::string predicate;
  std::vector<StepId> true_path_steps;
  std::vector<StepId> false_path_steps;
};

struct ParallelStepConfig {
  std::vector<StepId> child_step_ids;
};

struct SequentialStepConfig {
  std::vector<StepId> child_step_ids;
};

struct LoopStepConfig {
  std::string predicate;
  std::vector<StepId> body_step_ids;
  int max_iterations{1};
};

struct WaitStepConfig {
  std::optional<Duration> duration;
  std::string condition;
};

struct WebhookStepConfig {
  std::string event;
  std::string callback_url;
};

// Order matches StepType so that the variant index is the step type.
using StepConfig =
    std::variant<TaskStepConfig, ConditionStepConfig, ParallelStepConfig,
                 SequentialStepConfig, LoopStepConfig, WaitStepConfig,
                 WebhookStepConfig, CustomStepConfig>;

[[nodiscard]] inline auto step_type_of(const StepConfig &config) noexcept
    -> StepType {
  return static_cast<StepType>(config.index());
}

struct StepDependency {
  StepId step_id;
  StepId depends_on;
  DependencyType type{DependencyType::Completion};
  std::string condition_expression;
  bool optional{false};
};

struct WorkflowStep {
  StepId id;
  std::string name;
  int step_order{0};
  int priority{node_defaults::kPriority};
  StepConfig config{TaskStepConfig{}};
  std::optional<ResourceRequirement> resources;
  NodeLifecycle lifecycle;

  [[nodiscard]] auto type() const noexcept -> StepType {
    return step_type_of(config);
  }
};

struct RootCause {
  StepId step_id;
  ErrorInfo error;
};

struct Workflow {
  WorkflowId id;
  std::string name;
  int version{1};
  WorkflowStatus status{WorkflowStatus::Draft};
  int max_parallel_steps{4};
  Duration timeout{0}; // zero = no workflow timeout
  bool retry_failed_steps{true};
  JsonValue context{};
  JsonValue results{};
  std::optional<RootCause> root_cause;
  TimePoint created_at{};
  TimePoint updated_at{};
  std::optional<TimePoint> started_at;
  std::optional<TimePoint> completed_at;
};

// A workflow together with its single step graph; the unit the store persists
// and the orchestrator validates.
struct WorkflowGraph {
  Workflow workflow;
  std::vector<WorkflowStep> steps;
  std::vector<StepDependency> dependencies;

  [[nodiscard]] auto find_step(const StepId &id) const -> const WorkflowStep *;
  [[nodiscard]] auto find_step(const StepId &id) -> WorkflowStep *;
};

} // namespace flowcore
