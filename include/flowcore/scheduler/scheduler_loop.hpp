#pragma once

#include "flowcore/core/coroutine.hpp"
#include "flowcore/executor/step_executor.hpp"
#include "flowcore/orchestrator/task_pool.hpp"
#include "flowcore/orchestrator/workflow_run.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

namespace flowcore {

// Drives every started workflow and the standalone task pool. A pass checks
// workflow, step and task timers, promotes due retries, resolves readiness,
// advances tick-driven steps and then dispatches queued steps and tasks in
// one priority order. Passes run on the scheduler strand, once per tick and
// whenever wake() is called.
class SchedulerLoop {
public:
  SchedulerLoop(boost::asio::io_context &io, EngineServices &services,
                StepExecutor &executor, std::shared_ptr<TaskPool> tasks,
                Duration tick_interval);
  ~SchedulerLoop();

  SchedulerLoop(const SchedulerLoop &) = delete;
  auto operator=(const SchedulerLoop &) -> SchedulerLoop & = delete;

  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }

  // Schedules one extra pass; wake-ups arriving before it runs coalesce.
  auto wake() -> void;

  auto add(std::shared_ptr<WorkflowRun> run) -> void;
  auto remove(const WorkflowId &id) -> void;
  [[nodiscard]] auto find(const WorkflowId &id) const
      -> std::shared_ptr<WorkflowRun>;
  [[nodiscard]] auto active() const -> std::vector<WorkflowId>;

  auto run_pass(TimePoint now = Clock::now()) -> void;

  // Runs the io_context on `workers` threads until it is stopped.
  auto run(std::size_t workers) -> void;

private:
  auto tick_loop() -> spawn_task;

  // Caller holds run.mutex(). Returns true once the workflow is terminal.
  auto maintain(WorkflowRun &run, TimePoint now) -> bool;
  auto check_timers(WorkflowRun &run, TimePoint now) -> void;
  // Caller holds tasks_->mutex().
  auto maintain_tasks(TimePoint now) -> void;
  auto resolve(WorkflowRun &run, TimePoint now) -> void;
  auto cancel_descendants(WorkflowRun &run, NodeIndex idx, TimePoint now)
      -> void;
  auto dispatch(const std::vector<std::shared_ptr<WorkflowRun>> &runs,
                TimePoint now) -> std::size_t;
  [[nodiscard]] auto admit(const std::optional<ResourceRequirement> &resources)
      -> Result<std::optional<AdmissionToken>>;

  boost::asio::io_context &io_;
  EngineServices &services_;
  StepExecutor &executor_;
  std::shared_ptr<TaskPool> tasks_;
  Duration tick_interval_;
  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::steady_timer timer_;

  alignas(64) std::atomic<bool> running_{false};
  alignas(64) std::atomic<bool> wake_pending_{false};

  std::mutex pass_mu_;
  mutable std::mutex mu_; // guards runs_
  std::vector<std::shared_ptr<WorkflowRun>> runs_;
};

} // namespace flowcore
