#pragma once

#include "flowcore/core/coroutine.hpp"
#include "flowcore/orchestrator/task_pool.hpp"
#include "flowcore/orchestrator/workflow_run.hpp"

#include <memory>

namespace flowcore {

// Per-type step semantics. dispatch() moves an admitted step from queued to
// running and starts it; advance() drives the tick-based types (wait and the
// containers); runner results arrive through on_runner_result().
class StepExecutor {
public:
  // Caller holds run->mutex(). `admission` is handed to the run and released
  // when the step leaves running.
  auto dispatch(const std::shared_ptr<WorkflowRun> &run, NodeIndex idx,
                std::optional<AdmissionToken> admission,
                TimePoint now = Clock::now()) -> Result<void>;

  // Standalone task counterpart of dispatch(); caller holds pool->mutex().
  auto dispatch_task(const std::shared_ptr<TaskPool> &pool, NodeIndex idx,
                     std::optional<AdmissionToken> admission,
                     TimePoint now = Clock::now()) -> Result<void>;

  // Caller holds run->mutex(). Returns true if the step changed state.
  auto advance(WorkflowRun &run, NodeIndex idx, TimePoint now = Clock::now())
      -> bool;

  // Webhook completion channel; takes the run lock itself.
  auto complete_webhook(WorkflowRun &run, const StepId &step, JsonValue output)
      -> Result<void>;
  auto fail_webhook(WorkflowRun &run, const StepId &step, std::string message)
      -> Result<void>;

  // Input handed to a runner: workflow context, then the step input, plus
  // {"upstream": {id: output}} for direct dependencies.
  [[nodiscard]] static auto build_input(const WorkflowRun &run, NodeIndex idx,
                                        const JsonValue &step_input)
      -> JsonValue;

private:
  auto start_runner(const std::shared_ptr<WorkflowRun> &run, NodeIndex idx)
      -> void;
  auto run_condition(WorkflowRun &run, NodeIndex idx, TimePoint now) -> void;
  auto advance_wait(WorkflowRun &run, NodeIndex idx, TimePoint now) -> bool;
  auto advance_container(WorkflowRun &run, NodeIndex idx, TimePoint now)
      -> bool;
  // Settles running loop body steps once the loop is terminal.
  auto finish_loop_body(WorkflowRun &run, NodeIndex loop, TimePoint now)
      -> bool;

  auto execute_step(std::shared_ptr<WorkflowRun> run, NodeIndex idx,
                    int attempt, std::shared_ptr<TaskRunner> runner,
                    RunContext ctx, JsonValue config, JsonValue input)
      -> spawn_task;
  auto execute_loop(std::shared_ptr<WorkflowRun> run, NodeIndex idx,
                    int attempt) -> spawn_task;
  auto execute_task(std::shared_ptr<TaskPool> pool, TaskId id, int attempt,
                    std::shared_ptr<TaskRunner> runner, JsonValue config,
                    JsonValue input) -> spawn_task;

  auto on_runner_result(WorkflowRun &run, NodeIndex idx, int attempt,
                        Result<JsonValue> result) -> void;
  auto on_task_result(TaskPool &pool, const TaskId &id, int attempt,
                      Result<JsonValue> result) -> void;
};

} // namespace flowcore
