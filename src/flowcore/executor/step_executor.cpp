#include "flowcore/executor/step_executor.hpp"

#include "flowcore/util/log.hpp"

#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/system/system_error.hpp>

#include <algorithm>
#include <format>

namespace flowcore {

namespace {

struct RunnerCall {
  std::string key;
  JsonValue config{};
  JsonValue input{};
};

[[nodiscard]] auto runner_call(const WorkflowStep &step)
    -> std::optional<RunnerCall> {
  if (const auto *t = std::get_if<TaskStepConfig>(&step.config)) {
    return RunnerCall{t->task_type, t->task_config, t->input};
  }
  if (const auto *c = std::get_if<CustomStepConfig>(&step.config)) {
    return RunnerCall{c->handler, c->config, c->input};
  }
  return std::nullopt;
}

[[nodiscard]] auto is_current(WorkflowRun &run, NodeIndex idx, int attempt)
    -> bool {
  return run.runtime(idx).attempt == attempt &&
         run.step(idx).lifecycle.status == NodeStatus::Running;
}

auto invoke_runner(std::shared_ptr<TaskRunner> runner, RunContext ctx,
                   JsonValue config, JsonValue input)
    -> task<Result<JsonValue>> {
  try {
    co_return co_await runner->execute(std::move(ctx), std::move(config),
                                       std::move(input));
  } catch (const boost::system::system_error &ex) {
    if (ex.code() == boost::asio::error::operation_aborted) {
      co_return fail(Error::Cancelled);
    }
    log::warn("runner raised: {}", ex.what());
    co_return fail(Error::RunnerFailed);
  } catch (const std::exception &ex) {
    log::warn("runner raised: {}", ex.what());
    co_return fail(Error::RunnerFailed);
  }
}

// Completion handler for spawned step coroutines. Holding the signal keeps
// the bound cancellation slot valid until the coroutine has finished.
template <typename Id>
[[nodiscard]] auto
on_spawn_done(std::shared_ptr<boost::asio::cancellation_signal> signal,
              WorkflowId wf, Id step) {
  return boost::asio::bind_cancellation_slot(
      signal->slot(),
      [signal, wf = std::move(wf), step = std::move(step)](
          std::exception_ptr ep) {
        if (!ep) {
          return;
        }
        try {
          std::rethrow_exception(ep);
        } catch (const std::exception &ex) {
          log::error("{}/{}: step coroutine terminated: {}", wf, step,
                     ex.what());
        }
      });
}

} // namespace

auto StepExecutor::build_input(const WorkflowRun &run, NodeIndex idx,
                               const JsonValue &step_input) -> JsonValue {
  const auto &graph = run.graph();
  JsonValue input = graph.workflow.context.is_object()
                        ? graph.workflow.context
                        : make_json_object();
  if (step_input.is_object()) {
    json::merge_into(input, step_input);
  } else if (!step_input.is_null()) {
    input.get_object().insert_or_assign("input", step_input);
  }
  auto upstream = make_json_object();
  for (auto up : run.resolver().upstream_of(idx)) {
    const auto &s = graph.steps[up];
    if (s.lifecycle.status == NodeStatus::Completed) {
      upstream.get_object().insert_or_assign(s.id.str(),
                                             s.lifecycle.output_data);
    }
  }
  input.get_object().insert_or_assign("upstream", std::move(upstream));
  return input;
}

auto StepExecutor::dispatch(const std::shared_ptr<WorkflowRun> &run,
                            NodeIndex idx,
                            std::optional<AdmissionToken> admission,
                            TimePoint now) -> Result<void> {
  auto &rt = run->runtime(idx);
  const int attempt = rt.attempt + 1;
  if (auto res = run->transition(idx, NodeStatus::Queued, NodeStatus::Running,
                                 TransitionPayload{.attempt = attempt}, now);
      !res) {
    if (admission) {
      (void)run->services().allocator.release(*admission);
    }
    return res;
  }
  rt.attempt = attempt;
  rt.admission = admission;

  const auto &step = run->step(idx);
  log::debug("{}: dispatch {} ({}) attempt {}", run->id(), step.id,
             step.type(), attempt);

  switch (step.type()) {
  case StepType::Task:
  case StepType::Custom:
    start_runner(run, idx);
    break;
  case StepType::Condition:
    run_condition(*run, idx, now);
    break;
  case StepType::Parallel:
  case StepType::Sequential:
    break;
  case StepType::Loop: {
    for (auto child : run->resolver().children_of(idx)) {
      if (run->step(child).lifecycle.status != NodeStatus::Pending) {
        continue;
      }
      auto queued = run->transition(child, NodeStatus::Pending,
                                    NodeStatus::Queued, {}, now);
      if (queued) {
        queued = run->transition(child, NodeStatus::Queued,
                                 NodeStatus::Running, {}, now);
      }
      if (!queued) {
        log::warn("{}: loop body {} did not start: {}", run->id(),
                  run->step(child).id, queued.error().message());
      }
    }
    auto signal = std::make_shared<boost::asio::cancellation_signal>();
    rt.cancel = signal;
    co_spawn(run->strand(), execute_loop(run, idx, attempt),
             on_spawn_done(signal, run->id(), step.id));
    break;
  }
  case StepType::Wait:
    rt.wait_started_at = now;
    rt.paused_at.reset();
    rt.paused_total = Duration{0};
    (void)advance_wait(*run, idx, now);
    break;
  case StepType::Webhook:
    log::info("{}: webhook step {} awaiting '{}'", run->id(), step.id,
              std::get<WebhookStepConfig>(step.config).event);
    break;
  }
  return ok();
}

auto StepExecutor::start_runner(const std::shared_ptr<WorkflowRun> &run,
                                NodeIndex idx) -> void {
  const auto &step = run->step(idx);
  auto &rt = run->runtime(idx);
  auto call = runner_call(step);
  auto runner = call ? run->services().runners.find(call->key) : nullptr;
  if (!runner) {
    const std::string key = call ? call->key : std::string{};
    log::error("{}: no runner registered for '{}'", run->id(), key);
    if (auto res = run->fail(idx,
                             ErrorInfo{.kind = ErrorKind::RunnerError,
                                       .message = std::format(
                                           "no runner registered for '{}'",
                                           key)},
                             false);
        !res) {
      log::warn("{}: {}", run->id(), res.error().message());
    }
    return;
  }

  auto input = build_input(*run, idx, call->input);
  auto signal = std::make_shared<boost::asio::cancellation_signal>();
  rt.cancel = signal;
  co_spawn(run->strand(),
           execute_step(run, idx, rt.attempt, std::move(runner),
                        RunContext{.workflow_id = run->id(),
                                   .step_id = step.id,
                                   .attempt = rt.attempt},
                        std::move(call->config), std::move(input)),
           on_spawn_done(signal, run->id(), step.id));
}

auto StepExecutor::execute_step(std::shared_ptr<WorkflowRun> run,
                                NodeIndex idx, int attempt,
                                std::shared_ptr<TaskRunner> runner,
                                RunContext ctx, JsonValue config,
                                JsonValue input) -> spawn_task {
  co_await boost::asio::this_coro::throw_if_cancelled(false);
  auto result = co_await invoke_runner(std::move(runner), std::move(ctx),
                                       std::move(config), std::move(input));
  {
    std::scoped_lock lock(run->mutex());
    on_runner_result(*run, idx, attempt, std::move(result));
  }
  run->services().wake();
}

auto StepExecutor::on_runner_result(WorkflowRun &run, NodeIndex idx,
                                    int attempt, Result<JsonValue> result)
    -> void {
  if (!is_current(run, idx, attempt)) {
    log::debug("{}: discarding late result of {} attempt {}", run.id(),
               run.step(idx).id, attempt);
    return;
  }
  if (result) {
    if (auto res = run.complete(idx, std::move(*result)); !res) {
      log::warn("{}: completing {} failed: {}", run.id(), run.step(idx).id,
                res.error().message());
    }
    return;
  }
  if (auto res = run.fail(idx,
                          ErrorInfo{.kind = ErrorKind::RunnerError,
                                    .message = result.error().message()},
                          true);
      !res) {
    log::warn("{}: failing {} failed: {}", run.id(), run.step(idx).id,
              res.error().message());
  }
}

auto StepExecutor::dispatch_task(const std::shared_ptr<TaskPool> &pool,
                                 NodeIndex idx,
                                 std::optional<AdmissionToken> admission,
                                 TimePoint now) -> Result<void> {
  auto &rt = pool->runtime(idx);
  const int attempt = rt.attempt + 1;
  if (auto res = pool->transition(idx, NodeStatus::Queued, NodeStatus::Running,
                                  TransitionPayload{.attempt = attempt}, now);
      !res) {
    if (admission) {
      (void)pool->services().allocator.release(*admission);
    }
    return res;
  }
  rt.attempt = attempt;
  rt.admission = admission;

  const auto &task = pool->task(idx);
  log::debug("dispatch task {} ({}) attempt {}", task.id, task.task_type,
             attempt);
  auto runner = pool->services().runners.find(task.task_type);
  if (!runner) {
    log::error("no runner registered for task type '{}'", task.task_type);
    if (auto res = pool->fail(idx,
                              ErrorInfo{.kind = ErrorKind::RunnerError,
                                        .message = std::format(
                                            "no runner registered for '{}'",
                                            task.task_type)},
                              false, now);
        !res) {
      log::warn("task {}: {}", task.id, res.error().message());
    }
    return ok();
  }

  // Standalone tasks carry no separate runner config; input_data doubles as
  // both.
  auto signal = std::make_shared<boost::asio::cancellation_signal>();
  rt.cancel = signal;
  co_spawn(pool->strand(),
           execute_task(pool, task.id, attempt, std::move(runner),
                        task.input_data, pool->build_input(idx)),
           on_spawn_done(signal, WorkflowId{}, task.id));
  return ok();
}

auto StepExecutor::execute_task(std::shared_ptr<TaskPool> pool, TaskId id,
                                int attempt,
                                std::shared_ptr<TaskRunner> runner,
                                JsonValue config, JsonValue input)
    -> spawn_task {
  co_await boost::asio::this_coro::throw_if_cancelled(false);
  auto result = co_await invoke_runner(
      std::move(runner),
      RunContext{.step_id = StepId{id.value()}, .attempt = attempt},
      std::move(config), std::move(input));
  {
    std::scoped_lock lock(pool->mutex());
    on_task_result(*pool, id, attempt, std::move(result));
  }
  pool->services().wake();
}

auto StepExecutor::on_task_result(TaskPool &pool, const TaskId &id,
                                  int attempt, Result<JsonValue> result)
    -> void {
  const auto idx = pool.index_of(id);
  if (idx == kInvalidNode || pool.runtime(idx).attempt != attempt ||
      pool.task(idx).lifecycle.status != NodeStatus::Running) {
    log::debug("discarding late result of task {} attempt {}", id, attempt);
    return;
  }
  if (result) {
    if (auto res = pool.complete(idx, std::move(*result)); !res) {
      log::warn("completing task {} failed: {}", id, res.error().message());
    }
    return;
  }
  if (auto res = pool.fail(idx,
                           ErrorInfo{.kind = ErrorKind::RunnerError,
                                     .message = result.error().message()},
                           true);
      !res) {
    log::warn("failing task {} failed: {}", id, res.error().message());
  }
}

auto StepExecutor::run_condition(WorkflowRun &run, NodeIndex idx,
                                 TimePoint now) -> void {
  const auto &cfg = std::get<ConditionStepConfig>(run.step(idx).config);
  const auto ctx =
      make_evaluation_context(run.graph().steps, run.graph().workflow.context);
  auto verdict = run.services().evaluator.evaluate(cfg.predicate, ctx);
  if (!verdict) {
    (void)run.fail(idx,
                   ErrorInfo{.kind = ErrorKind::RunnerError,
                             .message = std::format("predicate '{}': {}",
                                                    cfg.predicate,
                                                    verdict.error().message())},
                   false, now);
    return;
  }
  const bool branch = *verdict;
  if (auto res = run.complete(
          idx,
          JsonValue{{"result", branch},
                    {"branch", std::string(branch ? "true" : "false")}},
          now);
      !res) {
    log::warn("{}: completing condition {} failed: {}", run.id(),
              run.step(idx).id, res.error().message());
    return;
  }
  const auto &skipped = branch ? cfg.false_path_steps : cfg.true_path_steps;
  for (const auto &id : skipped) {
    auto target = run.resolver().index_of(id);
    if (target == kInvalidNode ||
        is_terminal(run.step(target).lifecycle.status)) {
      continue;
    }
    (void)run.cancel(target,
                     ErrorInfo{.kind = ErrorKind::Skipped,
                               .message = std::format(
                                   "branch not taken by {}", run.step(idx).id)},
                     now);
  }
}

auto StepExecutor::advance(WorkflowRun &run, NodeIndex idx, TimePoint now)
    -> bool {
  const auto &step = run.step(idx);
  if (step.type() == StepType::Loop && is_terminal(step.lifecycle.status)) {
    return finish_loop_body(run, idx, now);
  }
  if (step.lifecycle.status != NodeStatus::Running) {
    return false;
  }
  switch (step.type()) {
  case StepType::Wait:
    return advance_wait(run, idx, now);
  case StepType::Parallel:
  case StepType::Sequential:
    return advance_container(run, idx, now);
  default:
    return false;
  }
}

auto StepExecutor::advance_wait(WorkflowRun &run, NodeIndex idx, TimePoint now)
    -> bool {
  const auto &cfg = std::get<WaitStepConfig>(run.step(idx).config);
  auto &rt = run.runtime(idx);
  if (run.step(idx).lifecycle.status != NodeStatus::Running ||
      !rt.wait_started_at) {
    return false;
  }
  const auto waited = std::chrono::duration_cast<Duration>(
      now - *rt.wait_started_at - rt.paused_total);

  const char *reason = nullptr;
  if (cfg.duration && waited >= *cfg.duration) {
    reason = "duration";
  } else if (!cfg.condition.empty()) {
    const auto ctx = make_evaluation_context(run.graph().steps,
                                             run.graph().workflow.context);
    auto verdict = run.services().evaluator.evaluate(cfg.condition, ctx);
    if (verdict && *verdict) {
      reason = "condition";
    } else if (!verdict) {
      log::debug("{}: wait condition of {} not evaluable: {}", run.id(),
                 run.step(idx).id, verdict.error().message());
    }
  }
  if (reason == nullptr) {
    return false;
  }
  auto res = run.complete(
      idx,
      JsonValue{{"reason", std::string(reason)},
                {"waited_ms", static_cast<double>(waited.count())}},
      now);
  return res.has_value();
}

auto StepExecutor::advance_container(WorkflowRun &run, NodeIndex idx,
                                     TimePoint now) -> bool {
  const auto children = run.resolver().children_of(idx);
  const bool settled = std::ranges::all_of(children, [&run](NodeIndex c) {
    return is_terminal(run.step(c).lifecycle.status);
  });
  if (!settled) {
    return false;
  }

  auto output = make_json_object();
  const WorkflowStep *failed_child = nullptr;
  for (auto c : children) {
    const auto &child = run.step(c);
    const auto &lc = child.lifecycle;
    if (lc.status == NodeStatus::Completed) {
      output.get_object().insert_or_assign(child.id.str(), lc.output_data);
    } else if (!is_skipped(lc) && failed_child == nullptr) {
      failed_child = &child;
    }
  }

  if (failed_child != nullptr) {
    run.step(idx).lifecycle.output_data = std::move(output);
    auto res = run.fail(idx,
                        ErrorInfo{.kind = ErrorKind::UpstreamFailed,
                                  .message = std::format("child {} {}",
                                                         failed_child->id,
                                                         failed_child->lifecycle
                                                             .status)},
                        false, now);
    return res.has_value();
  }
  return run.complete(idx, std::move(output), now).has_value();
}

auto StepExecutor::finish_loop_body(WorkflowRun &run, NodeIndex loop,
                                    TimePoint now) -> bool {
  const bool success =
      run.step(loop).lifecycle.status == NodeStatus::Completed;
  bool changed = false;
  for (auto child : run.resolver().children_of(loop)) {
    auto &lc = run.step(child).lifecycle;
    if (lc.status != NodeStatus::Running) {
      continue;
    }
    Result<void> res = ok();
    if (success) {
      res = run.complete(child, lc.output_data, now);
    } else {
      res = run.cancel(child,
                       ErrorInfo{.kind = ErrorKind::UpstreamFailed,
                                 .message = std::format(
                                     "loop {} ended {}", run.step(loop).id,
                                     run.step(loop).lifecycle.status)},
                       now);
    }
    changed = changed || res.has_value();
  }
  return changed;
}

auto StepExecutor::execute_loop(std::shared_ptr<WorkflowRun> run,
                                NodeIndex idx, int attempt) -> spawn_task {
  co_await boost::asio::this_coro::throw_if_cancelled(false);

  struct BodyCall {
    NodeIndex idx;
    std::shared_ptr<TaskRunner> runner;
    RunnerCall call;
  };

  auto end_loop = [this, &run, idx](auto &&apply) {
    apply();
    (void)finish_loop_body(*run, idx, Clock::now());
  };

  JsonValue last_output{};
  int iteration = 0;
  while (true) {
    std::vector<BodyCall> calls;
    int max_iterations = 1;
    {
      std::scoped_lock lock(run->mutex());
      if (!is_current(*run, idx, attempt)) {
        co_return;
      }
      const auto &cfg = std::get<LoopStepConfig>(run->step(idx).config);
      max_iterations = cfg.max_iterations;
      for (const auto &body_id : cfg.body_step_ids) {
        auto body = run->resolver().index_of(body_id);
        auto call = runner_call(run->step(body));
        auto runner =
            call ? run->services().runners.find(call->key) : nullptr;
        if (!runner) {
          end_loop([&] {
            (void)run->fail(idx,
                            ErrorInfo{.kind = ErrorKind::RunnerError,
                                      .message = std::format(
                                          "no runner for loop body {}",
                                          body_id)},
                            false);
          });
          co_return;
        }
        calls.push_back(BodyCall{body, std::move(runner), std::move(*call)});
      }
    }
    ++iteration;

    for (auto &body : calls) {
      JsonValue input;
      {
        std::scoped_lock lock(run->mutex());
        if (!is_current(*run, idx, attempt)) {
          co_return;
        }
        input = build_input(*run, body.idx, body.call.input);
        input.get_object().insert_or_assign(
            "iteration", static_cast<double>(iteration));
        input.get_object().insert_or_assign("last_output", last_output);
      }
      auto result = co_await invoke_runner(
          body.runner,
          RunContext{.workflow_id = run->id(),
                     .step_id = run->graph().steps[body.idx].id,
                     .attempt = attempt},
          body.call.config, std::move(input));

      std::scoped_lock lock(run->mutex());
      if (!is_current(*run, idx, attempt)) {
        co_return;
      }
      if (!result) {
        // Body steps stay running across loop attempts; the loop carries the
        // failure and finish_loop_body() settles them once it is terminal.
        const auto &body_id = run->step(body.idx).id;
        auto status = run->fail(
            idx,
            ErrorInfo{.kind = ErrorKind::RunnerError,
                      .message = std::format("body step {} failed in "
                                             "iteration {}: {}",
                                             body_id, iteration,
                                             result.error().message())},
            true);
        if (status && *status == NodeStatus::Failed) {
          (void)finish_loop_body(*run, idx, Clock::now());
        }
        run->services().wake();
        co_return;
      }
      run->step(body.idx).lifecycle.output_data = *result;
      last_output = std::move(*result);
    }

    {
      std::scoped_lock lock(run->mutex());
      if (!is_current(*run, idx, attempt)) {
        co_return;
      }
      const auto &cfg = std::get<LoopStepConfig>(run->step(idx).config);
      auto ctx = make_evaluation_context(run->graph().steps,
                                         run->graph().workflow.context);
      ctx.get_object().insert_or_assign("iteration",
                                        static_cast<double>(iteration));
      ctx.get_object().insert_or_assign("last_output", last_output);
      auto verdict = run->services().evaluator.evaluate(cfg.predicate, ctx);

      auto summary = [&](std::string_view exit) {
        return JsonValue{{"iterations", static_cast<double>(iteration)},
                         {"exit", std::string(exit)},
                         {"last_output", last_output}};
      };

      if (!verdict) {
        end_loop([&] {
          (void)run->fail(idx,
                          ErrorInfo{.kind = ErrorKind::RunnerError,
                                    .message = std::format(
                                        "loop predicate '{}': {}",
                                        cfg.predicate,
                                        verdict.error().message())},
                          false);
        });
      } else if (!*verdict) {
        end_loop([&] { (void)run->complete(idx, summary("predicate_false")); });
      } else if (iteration >= max_iterations) {
        end_loop([&] {
          run->step(idx).lifecycle.output_data =
              summary("max_iterations_exceeded");
          (void)run->fail(idx,
                          ErrorInfo{.kind = ErrorKind::MaxIterationsExceeded,
                                    .message = std::format(
                                        "predicate still true after {} "
                                        "iterations",
                                        iteration)},
                          false);
        });
      } else {
        continue;
      }
    }
    run->services().wake();
    co_return;
  }
}

auto StepExecutor::complete_webhook(WorkflowRun &run, const StepId &step,
                                    JsonValue output) -> Result<void> {
  {
    std::scoped_lock lock(run.mutex());
    auto idx = run.resolver().index_of(step);
    if (idx == kInvalidNode) {
      return fail(Error::NotFound);
    }
    const auto &s = run.step(idx);
    if (s.type() != StepType::Webhook ||
        s.lifecycle.status != NodeStatus::Running) {
      log::warn("{}: webhook completion for {} rejected ({} {})", run.id(),
                step, s.type(), s.lifecycle.status);
      return fail(Error::InvalidState);
    }
    if (auto res = run.complete(idx, std::move(output)); !res) {
      return res;
    }
  }
  run.services().wake();
  return ok();
}

auto StepExecutor::fail_webhook(WorkflowRun &run, const StepId &step,
                                std::string message) -> Result<void> {
  {
    std::scoped_lock lock(run.mutex());
    auto idx = run.resolver().index_of(step);
    if (idx == kInvalidNode) {
      return fail(Error::NotFound);
    }
    const auto &s = run.step(idx);
    if (s.type() != StepType::Webhook ||
        s.lifecycle.status != NodeStatus::Running) {
      log::warn("{}: webhook failure for {} rejected ({} {})", run.id(), step,
                s.type(), s.lifecycle.status);
      return fail(Error::InvalidState);
    }
    if (auto res = run.fail(idx,
                            ErrorInfo{.kind = ErrorKind::RunnerError,
                                      .message = std::move(message)},
                            true);
        !res) {
      return fail(res.error());
    }
  }
  run.services().wake();
  return ok();
}

} // namespace flowcore
