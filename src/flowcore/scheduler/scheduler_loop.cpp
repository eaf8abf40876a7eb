#include "flowcore/scheduler/scheduler_loop.hpp"

#include "flowcore/util/log.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

#include <algorithm>
#include <format>
#include <thread>
#include <tuple>

namespace flowcore {

namespace {

constexpr std::string_view kWorkflowTimeout = "workflow timeout exceeded";

// A queued workflow step, or a standalone task when `run` is null.
struct Candidate {
  std::shared_ptr<WorkflowRun> run;
  NodeIndex idx;
  int priority;
  std::uint64_t start_seq;
  int step_order;
};

} // namespace

SchedulerLoop::SchedulerLoop(boost::asio::io_context &io,
                             EngineServices &services, StepExecutor &executor,
                             std::shared_ptr<TaskPool> tasks,
                             Duration tick_interval)
    : io_(io), services_(services), executor_(executor),
      tasks_(std::move(tasks)), tick_interval_(tick_interval),
      strand_(boost::asio::make_strand(io)), timer_(strand_) {}

SchedulerLoop::~SchedulerLoop() { stop(); }

auto SchedulerLoop::start() -> void {
  if (running_.exchange(true)) {
    return;
  }
  co_spawn(strand_, tick_loop(), detached);
  log::info("scheduler started (tick {}ms)", tick_interval_.count());
}

auto SchedulerLoop::stop() -> void {
  if (!running_.exchange(false)) {
    return;
  }
  boost::asio::post(strand_, [this] { timer_.cancel(); });
  log::info("scheduler stopped");
}

auto SchedulerLoop::wake() -> void {
  if (!running_.load(std::memory_order_acquire) ||
      wake_pending_.exchange(true)) {
    return;
  }
  boost::asio::post(strand_, [this] {
    wake_pending_.store(false, std::memory_order_release);
    run_pass();
  });
}

auto SchedulerLoop::tick_loop() -> spawn_task {
  while (running_.load(std::memory_order_acquire)) {
    run_pass();
    timer_.expires_after(tick_interval_);
    auto [ec] = co_await timer_.async_wait(use_nothrow);
    if (ec && ec != boost::asio::error::operation_aborted) {
      log::warn("scheduler timer failed: {}", ec.message());
    }
  }
}

auto SchedulerLoop::run(std::size_t workers) -> void {
  std::vector<std::jthread> threads;
  threads.reserve(workers > 1 ? workers - 1 : 0);
  for (std::size_t i = 1; i < workers; ++i) {
    threads.emplace_back([this] { io_.run(); });
  }
  io_.run();
}

auto SchedulerLoop::add(std::shared_ptr<WorkflowRun> run) -> void {
  std::scoped_lock lock(mu_);
  runs_.push_back(std::move(run));
}

auto SchedulerLoop::remove(const WorkflowId &id) -> void {
  std::scoped_lock lock(mu_);
  std::erase_if(runs_, [&id](const auto &r) { return r->id() == id; });
}

auto SchedulerLoop::find(const WorkflowId &id) const
    -> std::shared_ptr<WorkflowRun> {
  std::scoped_lock lock(mu_);
  auto it = std::ranges::find_if(
      runs_, [&id](const auto &r) { return r->id() == id; });
  return it == runs_.end() ? nullptr : *it;
}

auto SchedulerLoop::active() const -> std::vector<WorkflowId> {
  std::scoped_lock lock(mu_);
  std::vector<WorkflowId> ids;
  ids.reserve(runs_.size());
  for (const auto &r : runs_) {
    ids.push_back(r->id());
  }
  return ids;
}

auto SchedulerLoop::run_pass(TimePoint now) -> void {
  std::scoped_lock pass(pass_mu_);
  std::vector<std::shared_ptr<WorkflowRun>> runs;
  {
    std::scoped_lock lock(mu_);
    runs = runs_;
  }

  std::vector<std::shared_ptr<WorkflowRun>> live;
  live.reserve(runs.size());
  for (auto &run : runs) {
    bool done = false;
    {
      std::scoped_lock lock(run->mutex());
      done = maintain(*run, now);
    }
    if (done) {
      log::debug("{}: leaves the scheduler", run->id());
      remove(run->id());
    } else {
      live.push_back(run);
    }
  }
  {
    std::scoped_lock lock(tasks_->mutex());
    maintain_tasks(now);
  }

  if (dispatch(live, now) > 0) {
    // Synchronous steps (condition, containers) may have settled already.
    wake();
  }
}

auto SchedulerLoop::maintain(WorkflowRun &run, TimePoint now) -> bool {
  auto &wf = run.workflow();
  if (is_terminal(wf.status)) {
    return true;
  }

  if (wf.timeout.count() > 0 && wf.started_at &&
      now - *wf.started_at >= wf.timeout) {
    log::warn("{}: {} after {}ms", run.id(), kWorkflowTimeout,
              wf.timeout.count());
    run.cancel_all(ErrorKind::Timeout, kWorkflowTimeout, now);
    if (!wf.root_cause) {
      wf.root_cause =
          RootCause{.step_id = StepId{},
                    .error = ErrorInfo{.kind = ErrorKind::Timeout,
                                       .message = std::string(kWorkflowTimeout),
                                       .at = now}};
    }
    if (auto res = run.transition_workflow(WorkflowStatus::Failed,
                                           kWorkflowTimeout, now);
        !res) {
      log::error("{}: could not fail timed-out workflow: {}", run.id(),
                 res.error().message());
    }
    return is_terminal(wf.status);
  }

  check_timers(run, now);

  if (wf.status == WorkflowStatus::Running) {
    for (NodeIndex i = 0; i < run.size(); ++i) {
      if (RetryManager::due(now, run.step(i).lifecycle)) {
        (void)run.transition(i, NodeStatus::Retrying, NodeStatus::Queued, {},
                             now);
      }
    }
  }

  resolve(run, now);
  return run.finalize_if_done(now);
}

auto SchedulerLoop::check_timers(WorkflowRun &run, TimePoint now) -> void {
  for (NodeIndex i = 0; i < run.size(); ++i) {
    if (run.inside_loop(i)) {
      continue;
    }
    const auto &step = run.step(i);
    switch (services_.retry.check(now, step.lifecycle)) {
    case TimeVerdict::None:
      break;
    case TimeVerdict::DeadlineExceeded:
      log::warn("{}: step {} missed its deadline", run.id(), step.id);
      if (run.cancel(i,
                     ErrorInfo{.kind = ErrorKind::DeadlineExceeded,
                               .message = "deadline exceeded",
                               .at = now},
                     now)) {
        cancel_descendants(run, i, now);
      }
      break;
    case TimeVerdict::Timeout: {
      // A wait ends by its duration, its condition or a cancel; never by a
      // per-attempt timeout. Deadlines still apply.
      if (step.type() == StepType::Wait) {
        break;
      }
      log::warn("{}: step {} attempt {} timed out after {}ms", run.id(),
                step.id, run.runtime(i).attempt, step.lifecycle.timeout.count());
      auto res = run.fail(i,
                          ErrorInfo{.kind = ErrorKind::Timeout,
                                    .message = std::format(
                                        "attempt exceeded {}ms",
                                        step.lifecycle.timeout.count()),
                                    .at = now},
                          true, now);
      if (res && *res == NodeStatus::Failed) {
        cancel_descendants(run, i, now);
      }
      break;
    }
    }
  }
}

auto SchedulerLoop::maintain_tasks(TimePoint now) -> void {
  auto &pool = *tasks_;
  for (NodeIndex i = 0; i < pool.size(); ++i) {
    const auto &task = pool.task(i);
    switch (services_.retry.check(now, task.lifecycle)) {
    case TimeVerdict::None:
      break;
    case TimeVerdict::DeadlineExceeded:
      log::warn("task {} missed its deadline", task.id);
      (void)pool.cancel(i,
                        ErrorInfo{.kind = ErrorKind::DeadlineExceeded,
                                  .message = "deadline exceeded",
                                  .at = now},
                        now);
      break;
    case TimeVerdict::Timeout:
      log::warn("task {} attempt {} timed out after {}ms", task.id,
                pool.runtime(i).attempt, task.lifecycle.timeout.count());
      (void)pool.fail(i,
                      ErrorInfo{.kind = ErrorKind::Timeout,
                                .message = std::format(
                                    "attempt exceeded {}ms",
                                    task.lifecycle.timeout.count()),
                                .at = now},
                      true, now);
      break;
    }
  }

  for (NodeIndex i = 0; i < pool.size(); ++i) {
    if (RetryManager::due(now, pool.task(i).lifecycle)) {
      (void)pool.transition(i, NodeStatus::Retrying, NodeStatus::Queued, {},
                            now);
    }
  }

  for (bool changed = true; changed;) {
    changed = false;
    const auto res = pool.resolve();
    for (auto i : res.ready) {
      changed = pool.transition(i, NodeStatus::Pending, NodeStatus::Queued, {},
                                now)
                    .has_value() ||
                changed;
    }
    for (auto i : res.cancelled) {
      changed = pool.cancel(i,
                            ErrorInfo{.kind = ErrorKind::UpstreamFailed,
                                      .message = "upstream failed",
                                      .at = now},
                            now)
                    .has_value() ||
                changed;
    }
    for (auto i : res.skipped) {
      changed = pool.cancel(i,
                            ErrorInfo{.kind = ErrorKind::Skipped,
                                      .message = "upstream skipped",
                                      .at = now},
                            now)
                    .has_value() ||
                changed;
    }
  }

  (void)pool.clear_if_settled();
}

auto SchedulerLoop::cancel_descendants(WorkflowRun &run, NodeIndex idx,
                                       TimePoint now) -> void {
  const auto type = run.step(idx).type();
  if (!is_container(type) && type != StepType::Loop) {
    return;
  }
  for (auto child : run.resolver().children_of(idx)) {
    if (!is_terminal(run.step(child).lifecycle.status)) {
      (void)run.cancel(child,
                       ErrorInfo{.kind = ErrorKind::UpstreamFailed,
                                 .message = std::format("parent {} ended",
                                                        run.step(idx).id),
                                 .at = now},
                       now);
    }
    cancel_descendants(run, child, now);
  }
}

auto SchedulerLoop::resolve(WorkflowRun &run, TimePoint now) -> void {
  for (bool changed = true; changed;) {
    changed = false;
    const auto res = run.resolver().resolve(run.resolve_context());
    for (auto i : res.ready) {
      changed = run.transition(i, NodeStatus::Pending, NodeStatus::Queued, {},
                               now)
                    .has_value() ||
                changed;
    }
    for (auto i : res.cancelled) {
      changed = run.cancel(i,
                           ErrorInfo{.kind = ErrorKind::UpstreamFailed,
                                     .message = "upstream failed",
                                     .at = now},
                           now)
                    .has_value() ||
                changed;
    }
    for (auto i : res.skipped) {
      changed = run.cancel(i,
                           ErrorInfo{.kind = ErrorKind::Skipped,
                                     .message = "upstream skipped",
                                     .at = now},
                           now)
                    .has_value() ||
                changed;
    }
    for (NodeIndex i = 0; i < run.size(); ++i) {
      changed = executor_.advance(run, i, now) || changed;
    }
  }
}

auto SchedulerLoop::dispatch(
    const std::vector<std::shared_ptr<WorkflowRun>> &runs, TimePoint now)
    -> std::size_t {
  std::vector<Candidate> candidates;
  for (const auto &run : runs) {
    std::scoped_lock lock(run->mutex());
    if (run->workflow().status != WorkflowStatus::Running) {
      continue;
    }
    for (NodeIndex i = 0; i < run->size(); ++i) {
      const auto &step = run->step(i);
      if (step.lifecycle.status == NodeStatus::Queued) {
        candidates.push_back(Candidate{.run = run,
                                       .idx = i,
                                       .priority = step.priority,
                                       .start_seq = run->start_seq(),
                                       .step_order = step.step_order});
      }
    }
  }
  {
    std::scoped_lock lock(tasks_->mutex());
    for (NodeIndex i = 0; i < tasks_->size(); ++i) {
      const auto &task = tasks_->task(i);
      if (task.lifecycle.status == NodeStatus::Queued) {
        candidates.push_back(
            Candidate{.run = nullptr,
                      .idx = i,
                      .priority = task.priority,
                      .start_seq = tasks_->runtime(i).submit_seq,
                      .step_order = 0});
      }
    }
  }

  std::ranges::sort(candidates, [](const Candidate &a, const Candidate &b) {
    return std::tuple(-a.priority, a.start_seq, a.step_order, a.idx) <
           std::tuple(-b.priority, b.start_seq, b.step_order, b.idx);
  });

  std::size_t dispatched = 0;
  for (const auto &c : candidates) {
    if (!c.run) {
      std::scoped_lock lock(tasks_->mutex());
      if (c.idx >= tasks_->size()) {
        continue;
      }
      const auto &task = tasks_->task(c.idx);
      if (task.lifecycle.status != NodeStatus::Queued) {
        continue;
      }
      auto token = admit(task.resources);
      if (!token) {
        log::debug("task {} waits for resources", task.id);
        continue;
      }
      if (auto res = executor_.dispatch_task(tasks_, c.idx, *token, now);
          !res) {
        log::warn("dispatch of task {} failed: {}", task.id,
                  res.error().message());
        continue;
      }
      ++dispatched;
      continue;
    }

    auto &run = *c.run;
    std::scoped_lock lock(run.mutex());
    const auto &step = run.step(c.idx);
    if (run.workflow().status != WorkflowStatus::Running ||
        step.lifecycle.status != NodeStatus::Queued) {
      continue;
    }
    if (run.holds_slot(c.idx) &&
        run.running_slots() >= run.workflow().max_parallel_steps) {
      continue;
    }
    auto token = admit(step.resources);
    if (!token) {
      log::debug("{}: step {} waits for resources", run.id(), step.id);
      continue;
    }
    if (auto res = executor_.dispatch(c.run, c.idx, *token, now); !res) {
      log::warn("{}: dispatch of {} failed: {}", run.id(), step.id,
                res.error().message());
      continue;
    }
    ++dispatched;
  }
  return dispatched;
}

auto SchedulerLoop::admit(const std::optional<ResourceRequirement> &resources)
    -> Result<std::optional<AdmissionToken>> {
  if (!resources || resources->empty()) {
    return ok(std::optional<AdmissionToken>{});
  }
  auto admitted = services_.allocator.try_admit(*resources);
  if (!admitted) {
    return fail(admitted.error());
  }
  return ok(std::optional<AdmissionToken>{*admitted});
}

} // namespace flowcore
