#pragma once

#include "flowcore/core/coroutine.hpp"
#include "flowcore/executor/task_runner.hpp"
#include "flowcore/model/workflow.hpp"
#include "flowcore/storage/graph_store.hpp"
#include "flowcore/util/id.hpp"
#include "flowcore/util/json.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <functional>
#include <initializer_list>
#include <mutex>
#include <optional>
#include <ranges>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

namespace flowcore::test {

// Run a coroutine synchronously on a fresh io_context and return its result.
// Throws if the coroutine does not complete within `timeout`.
template <typename T>
[[nodiscard]] inline auto
run_coro(task<T> coro,
         std::chrono::milliseconds timeout = std::chrono::seconds(10)) -> T {
  boost::asio::io_context io;
  std::exception_ptr eptr;
  std::optional<T> result;
  boost::asio::co_spawn(
      io,
      [&]() -> task<void> {
        result = co_await std::move(coro);
        co_return;
      },
      [&](std::exception_ptr e) { eptr = e; });
  io.run_for(timeout);
  if (!result && !eptr)
    throw std::runtime_error("run_coro timed out");
  if (eptr)
    std::rethrow_exception(eptr);
  return std::move(*result);
}

template <typename Predicate>
[[nodiscard]] inline auto
poll_until(Predicate &&predicate, std::chrono::milliseconds timeout,
           std::chrono::milliseconds interval = std::chrono::milliseconds(10))
    -> bool {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (std::invoke(std::forward<Predicate>(predicate))) {
      return true;
    }
    std::this_thread::sleep_for(interval);
  }
  return std::invoke(std::forward<Predicate>(predicate));
}

// Runs `io` on the calling thread in short slices until `predicate` holds.
// The predicate is checked between slices, never concurrently with handlers.
template <typename Predicate>
[[nodiscard]] inline auto
drive_until(boost::asio::io_context &io, Predicate &&predicate,
            std::chrono::milliseconds timeout = std::chrono::seconds(5),
            std::chrono::milliseconds slice = std::chrono::milliseconds(5))
    -> bool {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (std::invoke(predicate)) {
      return true;
    }
    if (io.stopped()) {
      io.restart();
    }
    io.run_for(slice);
  }
  return std::invoke(predicate);
}

// Keeps the io_context busy for `duration` regardless of any predicate.
inline void drive_for(boost::asio::io_context &io,
                      std::chrono::milliseconds duration) {
  (void)drive_until(io, [] { return false; }, duration);
}

[[nodiscard]] inline auto
make_temp_path(std::string_view prefix = "flowcore_test_") -> std::string {
  std::string templ = std::string("/tmp/") + std::string(prefix) + "XXXXXX";
  int fd = ::mkstemp(templ.data());
  if (fd < 0) {
    return "";
  }
  ::close(fd);
  return templ;
}

inline void sleep_ms(std::chrono::milliseconds ms) {
  std::this_thread::sleep_for(ms);
}

[[nodiscard]] inline auto json_of(std::string_view text) -> JsonValue {
  auto value = parse_json(text);
  if (!value) {
    throw std::runtime_error("invalid JSON literal in test");
  }
  return std::move(*value);
}

// Behaviour of ScriptedRunner for one step id.
struct Script {
  int fail_first{0};  // calls that return RunnerFailed
  int hang_first{0};  // calls that block until cancelled
  std::chrono::milliseconds delay{0};
  // Output for successful calls; defaults to {"step", "attempt"}.
  std::function<JsonValue(const RunContext &, const JsonValue &input)> output;
};

// Test runner whose outcome is scripted per step. Records every call and the
// highest number of overlapping calls. Honours cancellation while hanging or
// delaying.
class ScriptedRunner final : public TaskRunner {
public:
  struct Call {
    RunContext ctx;
    JsonValue input;
  };

  auto script(std::string_view step, Script s) -> void {
    std::scoped_lock lock(mu_);
    scripts_.emplace_back(std::string(step), std::move(s));
  }

  auto execute(RunContext ctx, JsonValue /*config*/, JsonValue input)
      -> task<Result<JsonValue>> override {
    Script s;
    int nth = 0;
    {
      std::scoped_lock lock(mu_);
      calls_.push_back(Call{ctx, input});
      nth = static_cast<int>(std::ranges::count_if(
          calls_, [&ctx](const Call &c) { return c.ctx.step_id == ctx.step_id; }));
      if (auto it = std::ranges::find_if(
              scripts_,
              [&ctx](const auto &entry) { return ctx.step_id == entry.first; });
          it != scripts_.end()) {
        s = it->second;
      }
    }
    const int now_active = ++active_;
    for (int prev = max_active_.load();
         now_active > prev && !max_active_.compare_exchange_weak(prev, now_active);) {
    }

    auto finish = [this](Result<JsonValue> r) {
      --active_;
      return r;
    };

    auto executor = co_await boost::asio::this_coro::executor;
    if (nth <= s.hang_first || s.delay.count() > 0) {
      boost::asio::steady_timer timer(executor);
      timer.expires_after(nth <= s.hang_first ? std::chrono::hours(1)
                                              : s.delay);
      auto [ec] = co_await timer.async_wait(use_nothrow);
      if (ec) {
        co_return finish(fail(Error::Cancelled));
      }
    }
    if (nth <= s.hang_first + s.fail_first) {
      co_return finish(fail(Error::RunnerFailed));
    }
    if (s.output) {
      co_return finish(ok(s.output(ctx, input)));
    }
    co_return finish(ok(JsonValue{{"step", ctx.step_id.str()},
                                  {"attempt", static_cast<double>(ctx.attempt)}}));
  }

  [[nodiscard]] auto calls() const -> std::vector<Call> {
    std::scoped_lock lock(mu_);
    return calls_;
  }

  [[nodiscard]] auto call_count() const -> std::size_t {
    std::scoped_lock lock(mu_);
    return calls_.size();
  }

  [[nodiscard]] auto call_count(std::string_view step) const -> std::size_t {
    std::scoped_lock lock(mu_);
    return static_cast<std::size_t>(std::ranges::count_if(
        calls_, [step](const Call &c) { return c.ctx.step_id == step; }));
  }

  // Step ids in call order.
  [[nodiscard]] auto order() const -> std::vector<std::string> {
    std::scoped_lock lock(mu_);
    std::vector<std::string> out;
    for (const auto &c : calls_) {
      out.push_back(c.ctx.step_id.str());
    }
    return out;
  }

  [[nodiscard]] auto active() const -> int { return active_.load(); }
  [[nodiscard]] auto max_active() const -> int { return max_active_.load(); }

private:
  mutable std::mutex mu_;
  std::vector<std::pair<std::string, Script>> scripts_;
  std::vector<Call> calls_;
  std::atomic<int> active_{0};
  std::atomic<int> max_active_{0};
};

// Graph builders

[[nodiscard]] inline auto task_step(std::string_view id,
                                    std::string_view task_type = "scripted",
                                    int max_retries = 0) -> WorkflowStep {
  WorkflowStep step{.id = StepId{id},
                    .name = std::string(id),
                    .config = TaskStepConfig{.task_type =
                                                 std::string(task_type)}};
  step.lifecycle.max_retries = max_retries;
  return step;
}

[[nodiscard]] inline auto ids(std::initializer_list<std::string_view> raw)
    -> std::vector<StepId> {
  std::vector<StepId> out;
  for (auto id : raw) {
    out.emplace_back(id);
  }
  return out;
}

[[nodiscard]] inline auto control_step(std::string_view id, StepConfig config)
    -> WorkflowStep {
  return WorkflowStep{.id = StepId{id},
                      .name = std::string(id),
                      .config = std::move(config)};
}

[[nodiscard]] inline auto
depend(std::string_view step, std::string_view on,
       DependencyType type = DependencyType::Completion, bool optional = false,
       std::string condition = {}) -> StepDependency {
  return StepDependency{.step_id = StepId{step},
                        .depends_on = StepId{on},
                        .type = type,
                        .condition_expression = std::move(condition),
                        .optional = optional};
}

[[nodiscard]] inline auto make_graph(std::string_view id,
                                     std::vector<WorkflowStep> steps,
                                     std::vector<StepDependency> deps = {})
    -> WorkflowGraph {
  WorkflowGraph graph{};
  graph.workflow.id = WorkflowId{id};
  graph.workflow.name = std::string(id);
  graph.workflow.context = make_json_object();
  for (auto [i, step] : steps | std::views::enumerate) {
    step.step_order = static_cast<int>(i);
  }
  graph.steps = std::move(steps);
  graph.dependencies = std::move(deps);
  return graph;
}

// Statuses a node entered, in audit order.
[[nodiscard]] inline auto trace_of(const std::vector<AuditEntry> &audit,
                                   const WorkflowId &wf, std::string_view step)
    -> std::vector<std::string> {
  const auto node = step_node_id(wf, StepId{step});
  std::vector<std::string> out;
  for (const auto &entry : audit) {
    if (entry.node_id == node) {
      out.push_back(entry.to);
    }
  }
  return out;
}

[[nodiscard]] inline auto find_entry(const std::vector<AuditEntry> &audit,
                                     const WorkflowId &wf,
                                     std::string_view step, std::string_view to)
    -> const AuditEntry * {
  const auto node = step_node_id(wf, StepId{step});
  auto it = std::ranges::find_if(audit, [&](const AuditEntry &e) {
    return e.node_id == node && e.to == to;
  });
  return it == audit.end() ? nullptr : &*it;
}

} // namespace flowcore::test
