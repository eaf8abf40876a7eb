#pragma once

#include "flowcore/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <format>
#include <string_view>

namespace flowcore {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

enum class NodeStatus : std::uint8_t {
  Pending,
  Queued,
  Running,
  Paused,
  Completed,
  Failed,
  Cancelled,
  Retrying,
};
BOOST_DESCRIBE_ENUM(NodeStatus, Pending, Queued, Running, Paused, Completed,
                    Failed, Cancelled, Retrying)
FLOWCORE_DEFINE_ENUM_SERDE(NodeStatus)

enum class WorkflowStatus : std::uint8_t {
  Draft,
  Ready,
  Running,
  Paused,
  Completed,
  Failed,
  Cancelled,
};
BOOST_DESCRIBE_ENUM(WorkflowStatus, Draft, Ready, Running, Paused, Completed,
                    Failed, Cancelled)
FLOWCORE_DEFINE_ENUM_SERDE(WorkflowStatus)

enum class StepType : std::uint8_t {
  Task,
  Condition,
  Parallel,
  Sequential,
  Loop,
  Wait,
  Webhook,
  Custom,
};
BOOST_DESCRIBE_ENUM(StepType, Task, Condition, Parallel, Sequential, Loop, Wait,
                    Webhook, Custom)
FLOWCORE_DEFINE_ENUM_SERDE(StepType)

enum class DependencyType : std::uint8_t {
  Completion,
  Data,
  Resource,
  Conditional,
};
BOOST_DESCRIBE_ENUM(DependencyType, Completion, Data, Resource, Conditional)
FLOWCORE_DEFINE_ENUM_SERDE(DependencyType)

// Tag recorded in a node's error_info.
enum class ErrorKind : std::uint8_t {
  Validation,
  RunnerError,
  Timeout,
  DeadlineExceeded,
  Cancelled,
  UpstreamFailed,
  Skipped,
  MaxIterationsExceeded,
};
BOOST_DESCRIBE_ENUM(ErrorKind, Validation, RunnerError, Timeout,
                    DeadlineExceeded, Cancelled, UpstreamFailed, Skipped,
                    MaxIterationsExceeded)
FLOWCORE_DEFINE_ENUM_SERDE(ErrorKind)

[[nodiscard]] constexpr auto is_terminal(NodeStatus s) noexcept -> bool {
  return s == NodeStatus::Completed || s == NodeStatus::Failed ||
         s == NodeStatus::Cancelled;
}

[[nodiscard]] constexpr auto is_terminal(WorkflowStatus s) noexcept -> bool {
  return s == WorkflowStatus::Completed || s == WorkflowStatus::Failed ||
         s == WorkflowStatus::Cancelled;
}

// Steps whose only job is to wait on their children; they never hold a
// max_parallel_steps slot.
[[nodiscard]] constexpr auto is_container(StepType t) noexcept -> bool {
  return t == StepType::Parallel || t == StepType::Sequential;
}

} // namespace flowcore

template <>
struct std::formatter<flowcore::NodeStatus> : std::formatter<std::string_view> {
  auto format(flowcore::NodeStatus s, auto &ctx) const {
    return std::formatter<std::string_view>::format(flowcore::to_string_view(s),
                                                    ctx);
  }
};

template <>
struct std::formatter<flowcore::WorkflowStatus>
    : std::formatter<std::string_view> {
  auto format(flowcore::WorkflowStatus s, auto &ctx) const {
    return std::formatter<std::string_view>::format(flowcore::to_string_view(s),
                                                    ctx);
  }
};

template <>
struct std::formatter<flowcore::StepType> : std::formatter<std::string_view> {
  auto format(flowcore::StepType t, auto &ctx) const {
    return std::formatter<std::string_view>::format(flowcore::to_string_view(t),
                                                    ctx);
  }
};

template <>
struct std::formatter<flowcore::ErrorKind> : std::formatter<std::string_view> {
  auto format(flowcore::ErrorKind k, auto &ctx) const {
    return std::formatter<std::string_view>::format(flowcore::to_string_view(k),
                                                    ctx);
  }
};
