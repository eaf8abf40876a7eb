#pragma once

#include "flowcore/model/status.hpp"
#include "flowcore/util/id.hpp"
#include "flowcore/util/json.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <flat_map>
#include <optional>
#include <string>

namespace flowcore {

namespace node_defaults {
inline constexpr int kPriority = 3;
inline constexpr int kMinPriority = 1;
inline constexpr int kMaxPriority = 5;
inline constexpr int kMaxRetries = 3;
inline constexpr Duration kStepTimeout = std::chrono::seconds(300);
} // namespace node_defaults

struct ErrorInfo {
  ErrorKind kind{ErrorKind::RunnerError};
  std::string message;
  TimePoint at{};

  [[nodiscard]] auto to_json() const -> JsonValue;
};

enum class NetworkClass : std::uint8_t { Low, Standard, High };
BOOST_DESCRIBE_ENUM(NetworkClass, Low, Standard, High)
FLOWCORE_DEFINE_ENUM_SERDE(NetworkClass)

// Declared claim on compute resources. Absent fields are unconstrained.
struct ResourceRequirement {
  double cpu_cores{0.0};
  std::uint64_t memory_mb{0};
  bool gpu{false};
  std::uint64_t disk_mb{0};
  std::optional<NetworkClass> network;
  std::flat_map<std::string, double> custom;

  [[nodiscard]] auto empty() const noexcept -> bool {
    return cpu_cores <= 0.0 && memory_mb == 0 && !gpu && disk_mb == 0 &&
           !network.has_value() && custom.empty();
  }
};

// Lifecycle fields shared by tasks and workflow steps. Only the state machine
// writes status, timestamps and retry_count.
struct NodeLifecycle {
  NodeStatus status{NodeStatus::Pending};
  int max_retries{0};
  int retry_count{0};
  Duration timeout{0}; // zero = no timeout
  std::optional<TimePoint> deadline;

  TimePoint created_at{};
  TimePoint updated_at{};
  std::optional<TimePoint> scheduled_at;
  std::optional<TimePoint> started_at;
  std::optional<TimePoint> completed_at;
  // Start of the current attempt; per-attempt timeouts are measured from here.
  std::optional<TimePoint> attempt_started_at;
  std::optional<Duration> estimated_duration;
  std::optional<Duration> actual_duration;

  JsonValue output_data{};
  std::optional<ErrorInfo> error_info;
};

struct Task {
  TaskId id;
  std::string name;
  std::string task_type;
  int priority{node_defaults::kPriority};
  std::optional<TaskId> parent_task_id;
  std::optional<WorkflowId> workflow_id;
  std::optional<StepId> step_id;
  JsonValue input_data{};
  JsonValue execution_context{};
  std::optional<ResourceRequirement> resources;
  NodeLifecycle lifecycle;
};

struct TaskDependency {
  TaskId task_id;
  TaskId depends_on;
  DependencyType type{DependencyType::Completion};
  std::string condition_expression;
  bool optional{false};
};

} // namespace flowcore
