#include "flowcore/executor/task_runner.hpp"

#include "flowcore/util/log.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/process/v2/start_dir.hpp>
#include <boost/process/v2/stdio.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <csignal>
#include <optional>
#include <ranges>
#include <string>
#include <utility>
#include <vector>

namespace flowcore {

namespace {

namespace bp = boost::process::v2;

inline constexpr std::size_t kMaxOutputSize = 4UZ * 1024 * 1024;
inline constexpr std::size_t kReadBufferSize = 4096;
inline constexpr std::size_t kPreviewSize = 120;

class NoopRunner final : public TaskRunner {
public:
  auto execute(RunContext ctx, JsonValue /*config*/, JsonValue input)
      -> task<Result<JsonValue>> override {
    log::trace("noop runner {}/{} attempt {}", ctx.workflow_id, ctx.step_id,
               ctx.attempt);
    co_return ok(std::move(input));
  }
};

[[nodiscard]] auto is_valid_env_key(std::string_view key) -> bool {
  if (key.empty() || std::isdigit(static_cast<unsigned char>(key.front()))) {
    return false;
  }
  return std::ranges::all_of(key, [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
  });
}

[[nodiscard]] auto preview(std::string_view text) -> std::string_view {
  return text.substr(0, std::min(text.size(), kPreviewSize));
}

[[nodiscard]] auto build_process_env(
    const std::vector<std::pair<std::string, std::string>> &custom)
    -> bp::process_environment {
  std::vector<bp::environment::key_value_pair> env_vec;
  env_vec.reserve(64);
  for (const auto &entry : bp::environment::current()) {
    auto key_sv = entry.key();
    const std::string key(key_sv.data(), key_sv.size());
    if (std::ranges::any_of(custom,
                            [&key](const auto &kv) { return kv.first == key; })) {
      continue;
    }
    env_vec.emplace_back(entry);
  }
  for (const auto &[k, v] : custom) {
    env_vec.emplace_back(bp::environment::key{k}, bp::environment::value{v});
  }
  return bp::process_environment(std::move(env_vec));
}

auto read_pipe_all(boost::asio::readable_pipe &pipe, std::string &out)
    -> task<void> {
  std::array<char, kReadBufferSize> buffer{};
  while (true) {
    auto [ec, bytes] = co_await pipe.async_read_some(
        boost::asio::buffer(buffer.data(), buffer.size()), use_nothrow);
    if (ec) {
      co_return;
    }
    if (bytes > 0 && out.size() < kMaxOutputSize) {
      const auto to_append = std::min(kMaxOutputSize - out.size(), bytes);
      out.append(buffer.data(), to_append);
    }
  }
}

struct ProcessOutcome {
  int exit_code{-1};
  bool cancelled{false};
};

auto wait_process(bp::process &proc) -> task<ProcessOutcome> {
  auto [ec, exit_code] = co_await proc.async_wait(use_nothrow);
  if (!ec) {
    co_return ProcessOutcome{.exit_code = exit_code};
  }
  // Cancelled from outside: kill the child so its pipes close.
  boost::system::error_code ignored;
  proc.terminate(ignored);
  if (const auto pid = proc.id(); pid > 0) {
    (void)::kill(pid, SIGKILL);
  }
  co_return ProcessOutcome{.exit_code = -1, .cancelled = true};
}

class ShellRunner final : public TaskRunner {
public:
  auto execute(RunContext ctx, JsonValue config, JsonValue input)
      -> task<Result<JsonValue>> override {
    co_await boost::asio::this_coro::throw_if_cancelled(false);

    const auto *command = json::find_path(config, "command");
    if (command == nullptr || !command->is_string() ||
        command->get<std::string>().empty()) {
      log::error("shell runner {}/{}: missing 'command'", ctx.workflow_id,
                 ctx.step_id);
      co_return fail(Error::InvalidArgument);
    }

    std::vector<std::pair<std::string, std::string>> env;
    env.emplace_back("FLOWCORE_INPUT", dump_json(input));
    env.emplace_back("FLOWCORE_WORKFLOW_ID", ctx.workflow_id.str());
    env.emplace_back("FLOWCORE_STEP_ID", ctx.step_id.str());
    env.emplace_back("FLOWCORE_ATTEMPT", std::to_string(ctx.attempt));
    if (const auto *vars = json::find_path(config, "env");
        vars != nullptr && vars->is_object()) {
      for (const auto &[key, value] : vars->get_object()) {
        if (!is_valid_env_key(key)) {
          log::error("shell runner: invalid environment key '{}'", key);
          co_return fail(Error::InvalidArgument);
        }
        env.emplace_back(key, value.is_string() ? value.get<std::string>()
                                                : dump_json(value));
      }
    }
    std::string working_dir;
    if (const auto *dir = json::find_path(config, "working_dir");
        dir != nullptr && dir->is_string()) {
      working_dir = dir->get<std::string>();
    }

    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::readable_pipe stdout_pipe(executor);
    boost::asio::readable_pipe stderr_pipe(executor);
    std::optional<bp::process> proc;
    try {
      std::vector<std::string> args{"-c", command->get<std::string>()};
      auto stdio = bp::process_stdio{
          .in = nullptr, .out = stdout_pipe, .err = stderr_pipe};
      if (working_dir.empty()) {
        proc.emplace(executor, "/bin/sh", args, std::move(stdio),
                     build_process_env(env));
      } else {
        proc.emplace(executor, "/bin/sh", args, std::move(stdio),
                     bp::process_start_dir{working_dir},
                     build_process_env(env));
      }
    } catch (const std::exception &ex) {
      log::error("shell runner {}/{}: spawn failed: {}", ctx.workflow_id,
                 ctx.step_id, ex.what());
      co_return fail(Error::RunnerFailed);
    }
    log::info("shell runner {}/{} attempt {} pid={} cmd='{}'", ctx.workflow_id,
              ctx.step_id, ctx.attempt, proc->id(),
              preview(command->get<std::string>()));

    std::string out;
    std::string err;
    using namespace awaitable_ops;
    auto outcome = co_await (read_pipe_all(stdout_pipe, out) &&
                             read_pipe_all(stderr_pipe, err) &&
                             wait_process(*proc));

    if (outcome.cancelled) {
      log::info("shell runner {}/{} cancelled", ctx.workflow_id, ctx.step_id);
      co_return fail(Error::Cancelled);
    }
    if (outcome.exit_code != 0) {
      log::warn("shell runner {}/{} exited with {}: {}", ctx.workflow_id,
                ctx.step_id, outcome.exit_code, preview(err));
      co_return fail(Error::RunnerFailed);
    }
    co_return ok(JsonValue{{"exit_code", outcome.exit_code},
                           {"stdout", std::move(out)},
                           {"stderr", std::move(err)}});
  }
};

} // namespace

auto create_noop_runner() -> std::shared_ptr<TaskRunner> {
  return std::make_shared<NoopRunner>();
}

auto create_shell_runner() -> std::shared_ptr<TaskRunner> {
  return std::make_shared<ShellRunner>();
}

auto register_builtin_runners(RunnerRegistry &registry) -> void {
  registry.add("noop", create_noop_runner());
  registry.add("shell", create_shell_runner());
}

} // namespace flowcore
