#pragma once

#include "flowcore/executor/predicate_evaluator.hpp"
#include "flowcore/executor/task_runner.hpp"
#include "flowcore/graph/dependency_resolver.hpp"
#include "flowcore/model/workflow.hpp"
#include "flowcore/resource/resource_allocator.hpp"
#include "flowcore/scheduler/retry_manager.hpp"
#include "flowcore/state/state_machine.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/strand.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

namespace flowcore {

struct StatusCallbacks {
  std::function<void(const WorkflowId &, WorkflowStatus)> on_workflow_status;
  std::function<void(const WorkflowId &, const StepId &, NodeStatus)>
      on_step_status;
};

// Collaborators shared by every run of one orchestrator.
struct EngineServices {
  boost::asio::any_io_executor executor;
  StateMachine &states;
  ResourceAllocator &allocator;
  const RetryManager &retry;
  const RunnerRegistry &runners;
  const PredicateEvaluator &evaluator;
  const StatusCallbacks &callbacks;
  std::function<void()> wake;
};

// Scheduler-side bookkeeping for one step; never persisted.
struct StepRuntime {
  int attempt{0};
  std::optional<AdmissionToken> admission;
  std::shared_ptr<boost::asio::cancellation_signal> cancel;
  std::optional<TimePoint> wait_started_at;
  std::optional<TimePoint> paused_at;
  Duration paused_total{0};
  std::optional<TaskId> task_id;
};

struct StepSnapshot {
  StepId id;
  std::string name;
  StepType type{StepType::Task};
  NodeStatus status{NodeStatus::Pending};
  int retry_count{0};
  int max_retries{0};
  std::optional<TaskId> task_id;
  std::optional<TimePoint> started_at;
  std::optional<TimePoint> completed_at;
  JsonValue output{};
  std::optional<ErrorInfo> error;
};

struct WorkflowSnapshot {
  WorkflowId id;
  std::string name;
  WorkflowStatus status{WorkflowStatus::Draft};
  double progress{0.0}; // percent of steps in a terminal state
  std::vector<StepSnapshot> steps;
  JsonValue results{};
  std::optional<RootCause> root_cause;
  std::vector<AuditEntry> audit;
  std::optional<TimePoint> started_at;
  std::optional<TimePoint> completed_at;
};

// `runtime` may be empty for workflows that were never started.
[[nodiscard]] auto make_snapshot(const WorkflowGraph &graph,
                                 std::span<const StepRuntime> runtime,
                                 std::vector<AuditEntry> audit)
    -> WorkflowSnapshot;

// Live state of one started workflow. Every member function except the
// accessors marked otherwise expects the caller to hold mutex(); the lock is
// never held across a co_await. Runner coroutines of this run execute on
// strand().
class WorkflowRun : public std::enable_shared_from_this<WorkflowRun> {
public:
  WorkflowRun(WorkflowGraph graph, DependencyResolver resolver,
              EngineServices &services, std::uint64_t start_seq);

  WorkflowRun(const WorkflowRun &) = delete;
  WorkflowRun &operator=(const WorkflowRun &) = delete;

  // Lock-free accessors.
  [[nodiscard]] auto id() const noexcept -> const WorkflowId & { return id_; }
  [[nodiscard]] auto start_seq() const noexcept -> std::uint64_t {
    return start_seq_;
  }
  [[nodiscard]] auto mutex() const noexcept -> std::mutex & { return mu_; }
  [[nodiscard]] auto strand() const noexcept
      -> const boost::asio::strand<boost::asio::any_io_executor> & {
    return strand_;
  }
  [[nodiscard]] auto services() const noexcept -> EngineServices & {
    return services_;
  }

  [[nodiscard]] auto graph() noexcept -> WorkflowGraph & { return graph_; }
  [[nodiscard]] auto graph() const noexcept -> const WorkflowGraph & {
    return graph_;
  }
  [[nodiscard]] auto workflow() noexcept -> Workflow & {
    return graph_.workflow;
  }
  [[nodiscard]] auto resolver() const noexcept -> const DependencyResolver & {
    return resolver_;
  }
  [[nodiscard]] auto step(NodeIndex idx) -> WorkflowStep & {
    return graph_.steps[idx];
  }
  [[nodiscard]] auto runtime(NodeIndex idx) -> StepRuntime & {
    return runtime_[idx];
  }
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return graph_.steps.size();
  }
  [[nodiscard]] auto ref(NodeIndex idx) const -> NodeRef;
  [[nodiscard]] auto resolve_context() const -> ResolveContext;

  // Node transitions. Each releases the admission and signals an in-flight
  // runner when the node leaves running.
  auto transition(NodeIndex idx, NodeStatus from, NodeStatus to,
                  TransitionPayload payload = {}, TimePoint now = Clock::now())
      -> Result<void>;
  auto complete(NodeIndex idx, JsonValue output, TimePoint now = Clock::now())
      -> Result<void>;
  auto fail(NodeIndex idx, ErrorInfo error, bool retryable,
            TimePoint now = Clock::now()) -> Result<NodeStatus>;
  auto cancel(NodeIndex idx, ErrorInfo error, TimePoint now = Clock::now())
      -> Result<void>;

  auto transition_workflow(WorkflowStatus to, std::string_view detail = {},
                           TimePoint now = Clock::now()) -> Result<void>;

  // Cancels every non-terminal step with `kind`.
  auto cancel_all(ErrorKind kind, std::string_view message,
                  TimePoint now = Clock::now()) -> void;

  // Running steps that hold a max_parallel_steps slot.
  [[nodiscard]] auto running_slots() const -> int;
  [[nodiscard]] auto holds_slot(NodeIndex idx) const -> bool;
  [[nodiscard]] auto inside_loop(NodeIndex idx) const -> bool;

  // Marks the workflow completed or failed once every step is terminal.
  // Returns true when the workflow is terminal afterwards.
  auto finalize_if_done(TimePoint now = Clock::now()) -> bool;
  [[nodiscard]] auto all_terminal() const -> bool;

  [[nodiscard]] auto snapshot() const -> WorkflowSnapshot;

private:
  auto release(NodeIndex idx) -> void;
  auto mirror_task(NodeIndex idx) -> void;
  auto notify_step(NodeIndex idx) -> void;
  auto notify_workflow() -> void;
  [[nodiscard]] auto find_root_cause() const -> std::optional<RootCause>;

  WorkflowId id_;
  std::uint64_t start_seq_;
  EngineServices &services_;
  boost::asio::strand<boost::asio::any_io_executor> strand_;
  mutable std::mutex mu_;

  WorkflowGraph graph_;
  DependencyResolver resolver_;
  std::vector<StepRuntime> runtime_;
};

} // namespace flowcore
