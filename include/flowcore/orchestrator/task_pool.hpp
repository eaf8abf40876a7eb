#pragma once

#include "flowcore/graph/dependency_resolver.hpp"
#include "flowcore/orchestrator/workflow_run.hpp"

#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/strand.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace flowcore {

struct TaskRuntime {
  int attempt{0};
  std::uint64_t submit_seq{0};
  std::optional<AdmissionToken> admission;
  std::shared_ptr<boost::asio::cancellation_signal> cancel;
};

// Standalone tasks (no owning workflow) and the TaskDependency edges between
// them. The scheduler resolves, times and dispatches them in the same pass as
// workflow steps. Member functions other than the lock-free accessors expect
// the caller to hold mutex().
class TaskPool : public std::enable_shared_from_this<TaskPool> {
public:
  explicit TaskPool(EngineServices &services);

  TaskPool(const TaskPool &) = delete;
  TaskPool &operator=(const TaskPool &) = delete;

  // Lock-free accessors.
  [[nodiscard]] auto mutex() const noexcept -> std::mutex & { return mu_; }
  [[nodiscard]] auto strand() const noexcept
      -> const boost::asio::strand<boost::asio::any_io_executor> & {
    return strand_;
  }
  [[nodiscard]] auto services() const noexcept -> EngineServices & {
    return services_;
  }

  // Registers a persisted task. Tasks already known keep their state.
  auto add(Task task, std::uint64_t submit_seq) -> Result<NodeIndex>;
  auto add_dependency(const TaskDependency &dep) -> Result<void>;

  [[nodiscard]] auto index_of(const TaskId &id) const -> NodeIndex {
    return resolver_.graph().index_of(id.value());
  }
  [[nodiscard]] auto task(NodeIndex idx) -> Task & { return tasks_[idx]; }
  [[nodiscard]] auto runtime(NodeIndex idx) -> TaskRuntime & {
    return runtime_[idx];
  }
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return tasks_.size();
  }
  [[nodiscard]] auto resolver() const noexcept -> const DependencyResolver & {
    return resolver_;
  }
  [[nodiscard]] auto resolve() const -> Resolution;

  auto transition(NodeIndex idx, NodeStatus from, NodeStatus to,
                  TransitionPayload payload = {}, TimePoint now = Clock::now())
      -> Result<void>;
  auto complete(NodeIndex idx, JsonValue output, TimePoint now = Clock::now())
      -> Result<void>;
  auto fail(NodeIndex idx, ErrorInfo error, bool retryable,
            TimePoint now = Clock::now()) -> Result<NodeStatus>;
  auto cancel(NodeIndex idx, ErrorInfo error, TimePoint now = Clock::now())
      -> Result<void>;

  // Runner input: execution_context, then input_data, plus
  // {"upstream": {id: output}} for completed direct dependencies.
  [[nodiscard]] auto build_input(NodeIndex idx) const -> JsonValue;

  // Drops every task once all of them are terminal; later dependencies on
  // them are reloaded from the store.
  auto clear_if_settled() -> bool;

private:
  auto release(NodeIndex idx) -> void;
  [[nodiscard]] auto ref(NodeIndex idx) const -> NodeRef;

  EngineServices &services_;
  boost::asio::strand<boost::asio::any_io_executor> strand_;
  mutable std::mutex mu_;

  std::vector<Task> tasks_;
  std::vector<TaskRuntime> runtime_;
  DependencyResolver resolver_;
};

} // namespace flowcore
