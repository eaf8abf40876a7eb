#pragma once

#include "flowcore/core/coroutine.hpp"
#include "flowcore/core/error.hpp"
#include "flowcore/util/id.hpp"
#include "flowcore/util/json.hpp"
#include "flowcore/util/string_hash.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace flowcore {

struct RunContext {
  WorkflowId workflow_id;
  StepId step_id;
  int attempt{1};
};

// Executes one unit of work. Implementations must honour asio cancellation:
// when the caller's cancellation slot fires, outstanding operations are
// aborted and the coroutine returns promptly. The result of a cancelled call
// is ignored.
class TaskRunner {
public:
  virtual ~TaskRunner() = default;

  [[nodiscard]] virtual auto execute(RunContext ctx, JsonValue config,
                                     JsonValue input)
      -> task<Result<JsonValue>> = 0;
};

// Instance-owned map from task type (or custom handler name) to runner.
class RunnerRegistry {
public:
  auto add(std::string type, std::shared_ptr<TaskRunner> runner) -> void {
    runners_.insert_or_assign(std::move(type), std::move(runner));
  }

  [[nodiscard]] auto find(std::string_view type) const
      -> std::shared_ptr<TaskRunner> {
    auto it = runners_.find(type);
    return it != runners_.end() ? it->second : nullptr;
  }

  [[nodiscard]] auto contains(std::string_view type) const -> bool {
    return runners_.contains(type);
  }

  [[nodiscard]] auto types() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(runners_.size());
    for (const auto &[type, runner] : runners_) {
      out.push_back(type);
    }
    return out;
  }

private:
  StringMap<std::shared_ptr<TaskRunner>> runners_;
};

// Echoes its input back as output.
[[nodiscard]] auto create_noop_runner() -> std::shared_ptr<TaskRunner>;

// Runs `config.command` through /bin/sh -c. Output is
// {"exit_code", "stdout", "stderr"}; a non-zero exit is a RunnerFailed error.
// The step input is exported to the process as FLOWCORE_INPUT (JSON).
[[nodiscard]] auto create_shell_runner() -> std::shared_ptr<TaskRunner>;

// Registers "noop" and "shell".
auto register_builtin_runners(RunnerRegistry &registry) -> void;

} // namespace flowcore
