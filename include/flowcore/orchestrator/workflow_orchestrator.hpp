#pragma once

#include "flowcore/executor/predicate_evaluator.hpp"
#include "flowcore/executor/step_executor.hpp"
#include "flowcore/executor/task_runner.hpp"
#include "flowcore/orchestrator/task_pool.hpp"
#include "flowcore/orchestrator/workflow_run.hpp"
#include "flowcore/resource/resource_allocator.hpp"
#include "flowcore/scheduler/retry_manager.hpp"
#include "flowcore/scheduler/scheduler_loop.hpp"
#include "flowcore/state/state_machine.hpp"
#include "flowcore/storage/graph_store.hpp"

#include <boost/asio/io_context.hpp>

#include <atomic>
#include <memory>
#include <vector>

namespace flowcore {

struct OrchestratorOptions {
  Duration tick_interval{std::chrono::milliseconds(100)};
  ResourceBudget budget{};
  RetryManager::Policy retry{};
  // Defaults to ComparisonPredicateEvaluator.
  std::shared_ptr<const PredicateEvaluator> evaluator;
};

// Public operations on workflows. Owns the scheduler, which holds each run
// until it is terminal; afterwards status comes from the injected GraphStore.
class WorkflowOrchestrator {
public:
  WorkflowOrchestrator(boost::asio::io_context &io, GraphStore &store,
                       const RunnerRegistry &runners,
                       OrchestratorOptions options = {});
  ~WorkflowOrchestrator();

  WorkflowOrchestrator(const WorkflowOrchestrator &) = delete;
  auto operator=(const WorkflowOrchestrator &)
      -> WorkflowOrchestrator & = delete;

  auto start() -> void;
  auto stop() -> void;

  // Validates, persists as draft and promotes to ready. An empty workflow id
  // is replaced by a generated one.
  [[nodiscard]] auto create_workflow(WorkflowGraph graph)
      -> Result<WorkflowId>;
  [[nodiscard]] auto start_workflow(const WorkflowId &id) -> Result<void>;
  [[nodiscard]] auto pause_workflow(const WorkflowId &id) -> Result<void>;
  [[nodiscard]] auto resume_workflow(const WorkflowId &id) -> Result<void>;
  [[nodiscard]] auto cancel_workflow(const WorkflowId &id) -> Result<void>;

  [[nodiscard]] auto get_status(const WorkflowId &id) const
      -> Result<WorkflowSnapshot>;
  [[nodiscard]] auto get_task_status(const TaskId &id) const -> Result<Task>;

  // Standalone tasks. submit_task persists a pending task without a
  // workflow and hands it to the scheduler; an empty id is generated. A
  // parent_task_id makes the task wait for its parent to complete.
  [[nodiscard]] auto submit_task(Task task) -> Result<TaskId>;
  // The dependent task must still be pending. Cycles are rejected.
  [[nodiscard]] auto add_task_dependency(const TaskDependency &dep)
      -> Result<void>;
  [[nodiscard]] auto cancel_task(const TaskId &id) -> Result<void>;
  [[nodiscard]] auto list_active_workflows() const -> std::vector<WorkflowId>;

  [[nodiscard]] auto complete_webhook(const WorkflowId &id, const StepId &step,
                                      JsonValue output) -> Result<void>;
  [[nodiscard]] auto fail_webhook(const WorkflowId &id, const StepId &step,
                                  std::string message) -> Result<void>;

  // Must be set before the first workflow starts.
  auto set_callbacks(StatusCallbacks callbacks) -> void;

  [[nodiscard]] auto scheduler() noexcept -> SchedulerLoop & {
    return scheduler_;
  }
  [[nodiscard]] auto allocator() const noexcept -> const ResourceAllocator & {
    return allocator_;
  }

private:
  [[nodiscard]] auto find_run(const WorkflowId &id) const
      -> std::shared_ptr<WorkflowRun>;
  [[nodiscard]] auto find_live_run(const WorkflowId &id) const
      -> std::shared_ptr<WorkflowRun>;
  // Caller holds tasks_->mutex(). Loads a standalone task from the store
  // into the pool unless it is already there.
  [[nodiscard]] auto pooled_task(const TaskId &id) -> Result<NodeIndex>;

  GraphStore &store_;
  std::shared_ptr<const PredicateEvaluator> evaluator_;
  StateMachine states_;
  ResourceAllocator allocator_;
  RetryManager retry_;
  StatusCallbacks callbacks_;
  EngineServices services_;
  StepExecutor executor_;
  std::shared_ptr<TaskPool> tasks_;
  SchedulerLoop scheduler_;

  std::atomic<std::uint64_t> next_seq_{0};
};

} // namespace flowcore
