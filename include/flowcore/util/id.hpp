#pragma once

#include <compare>
#include <concepts>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace flowcore {

// Phantom type tags for type-safe ID disambiguation
struct WorkflowTag {};
struct StepTag {};
struct TaskTag {};
struct NodeTag {};

template <typename Tag> class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}
  explicit TypedId(std::string_view value) : value_(value) {}
  explicit TypedId(const char *value) : value_(value ? value : "") {}

  TypedId() = default;

  [[nodiscard]] auto value() const noexcept -> std::string_view {
    return value_;
  }
  [[nodiscard]] auto str() const noexcept -> const std::string & {
    return value_;
  }

  [[nodiscard]] friend auto operator<=>(const TypedId &lhs,
                                        const TypedId &rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId &lhs, const TypedId &rhs)
      -> bool = default;

  [[nodiscard]] friend auto operator==(const TypedId &lhs,
                                       std::string_view rhs) noexcept -> bool {
    return lhs.value_ == rhs;
  }

  [[nodiscard]] auto empty() const noexcept -> bool { return value_.empty(); }

private:
  std::string value_;
};

using WorkflowId = TypedId<WorkflowTag>;
using StepId = TypedId<StepTag>;
using TaskId = TypedId<TaskTag>;
// Store-level key shared by tasks and steps.
using NodeId = TypedId<NodeTag>;

template <typename T>
concept IsTypedId = requires(T id) {
  { id.value() } -> std::convertible_to<std::string_view>;
  { id.empty() } -> std::convertible_to<bool>;
};

template <typename Tag>
inline auto operator<<(std::ostream &os, const TypedId<Tag> &id)
    -> std::ostream & {
  return os << id.value();
}

} // namespace flowcore

// `is_avalanching` tells ankerl::unordered_dense::hash to delegate to
// std::hash<TypedId<T>> instead of hashing the std::string object bytes.
template <typename Tag> struct std::hash<flowcore::TypedId<Tag>> {
  using is_avalanching = void;
  auto operator()(const flowcore::TypedId<Tag> &id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<flowcore::TypedId<Tag>>
    : std::formatter<std::string_view> {
  auto format(const flowcore::TypedId<Tag> &id, auto &ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};

namespace flowcore {

namespace detail {
// `prefix` followed by a millisecond timestamp, a per-process sequence and
// random bits. Ids from one process sort by creation order.
[[nodiscard]] auto generate_id(std::string_view prefix) -> std::string;
} // namespace detail

[[nodiscard]] inline auto generate_workflow_id() -> WorkflowId {
  return WorkflowId{detail::generate_id("wf-")};
}

[[nodiscard]] inline auto generate_task_id() -> TaskId {
  return TaskId{detail::generate_id("task-")};
}

[[nodiscard]] inline auto step_node_id(const WorkflowId &workflow_id,
                                       const StepId &step_id) -> NodeId {
  return NodeId{std::format("{}/{}", workflow_id, step_id)};
}

[[nodiscard]] inline auto task_node_id(const TaskId &task_id) -> NodeId {
  return NodeId{std::format("task/{}", task_id)};
}

} // namespace flowcore
