#include "flowcore/cli/commands.hpp"

#include "flowcore/config/config.hpp"
#include "flowcore/config/workflow_definition.hpp"
#include "flowcore/executor/task_runner.hpp"
#include "flowcore/orchestrator/workflow_orchestrator.hpp"
#include "flowcore/storage/memory_graph_store.hpp"
#include "flowcore/util/json.hpp"
#include "flowcore/util/log.hpp"
#include "flowcore/util/time.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <print>

namespace flowcore::cli {

namespace {

auto configure_logging(const SystemConfig &cfg, const RunOptions &opts)
    -> void {
  log::set_output_stderr();
  if (!cfg.log.file.empty() && !log::set_output_file(cfg.log.file)) {
    std::println(stderr, "Warning: cannot open log file {}", cfg.log.file);
  }
  log::set_level(opts.log_level.empty() ? std::string_view(cfg.log.level)
                                        : std::string_view(opts.log_level));
  log::start();
}

auto print_summary(const WorkflowSnapshot &snap) -> void {
  std::println("workflow {} ({}) {} {:.0f}%", snap.id, snap.name, snap.status,
               snap.progress);
  for (const auto &step : snap.steps) {
    std::string note;
    if (step.error) {
      note = std::format(" [{}: {}]", step.error->kind, step.error->message);
    }
    const auto took = util::elapsed_ms(step.started_at, step.completed_at);
    std::println("  {:<20} {:<10} {:<10} retries {}/{} {:>7}{}", step.id,
                 step.type, step.status, step.retry_count, step.max_retries,
                 took ? std::format("{}ms", *took) : std::string("-"), note);
  }
  if (snap.root_cause) {
    std::println("root cause: {} {}: {}",
                 snap.root_cause->step_id.empty()
                     ? std::string_view("<workflow>")
                     : snap.root_cause->step_id.value(),
                 snap.root_cause->error.kind, snap.root_cause->error.message);
  }
}

auto print_json(const WorkflowSnapshot &snap) -> void {
  auto steps = make_json_array();
  for (const auto &step : snap.steps) {
    JsonValue entry{{"id", step.id.str()},
                    {"type", std::string(to_string_view(step.type))},
                    {"status", std::string(to_string_view(step.status))},
                    {"retry_count", static_cast<double>(step.retry_count)},
                    {"started_at", util::format_iso8601(step.started_at)},
                    {"completed_at", util::format_iso8601(step.completed_at)},
                    {"output", step.output}};
    if (auto took = util::elapsed_ms(step.started_at, step.completed_at)) {
      entry.get_object().insert_or_assign("duration_ms",
                                          static_cast<double>(*took));
    }
    if (step.error) {
      entry.get_object().insert_or_assign("error", step.error->to_json());
    }
    steps.get_array().push_back(std::move(entry));
  }
  JsonValue out{{"id", snap.id.str()},
                {"status", std::string(to_string_view(snap.status))},
                {"progress", snap.progress},
                {"steps", std::move(steps)},
                {"results", snap.results}};
  if (snap.root_cause) {
    out.get_object().insert_or_assign(
        "root_cause", JsonValue{{"step", snap.root_cause->step_id.str()},
                                {"error", snap.root_cause->error.to_json()}});
  }
  std::println("{}", dump_json(out));
}

} // namespace

auto cmd_run(const RunOptions &opts) -> int {
  auto cfg = opts.config_file.empty()
                 ? ConfigLoader::load_defaults()
                 : ConfigLoader::load_from_file(opts.config_file);
  if (!cfg) {
    std::println(stderr, "Error: config: {}", cfg.error().message());
    return 1;
  }
  configure_logging(*cfg, opts);

  std::string diagnostic;
  auto graph = WorkflowDefinitionLoader::load_from_file(
      opts.file, DefinitionDefaults::from(cfg->defaults), &diagnostic);
  if (!graph) {
    std::println(stderr, "Error: {}",
                 diagnostic.empty() ? graph.error().message() : diagnostic);
    log::stop();
    return 1;
  }
  if (!opts.context.empty()) {
    auto overlay = parse_json(opts.context);
    if (!overlay || !overlay->is_object()) {
      std::println(stderr, "Error: --context must be a JSON object");
      log::stop();
      return 1;
    }
    json::merge_into(graph->workflow.context, *overlay);
  }

  boost::asio::io_context io;
  MemoryGraphStore store;
  RunnerRegistry runners;
  register_builtin_runners(runners);
  WorkflowOrchestrator orchestrator(io, store, runners,
                                    to_orchestrator_options(*cfg));
  orchestrator.set_callbacks(StatusCallbacks{
      .on_workflow_status =
          [&io](const WorkflowId &id, WorkflowStatus status) {
            log::info("workflow {} is {}", id, status);
            if (is_terminal(status)) {
              io.stop();
            }
          },
      .on_step_status =
          [](const WorkflowId &id, const StepId &step, NodeStatus status) {
            log::debug("{}/{} -> {}", id, step, status);
          }});

  auto id = orchestrator.create_workflow(std::move(*graph));
  if (!id) {
    std::println(stderr, "Error: workflow rejected: {}", id.error().message());
    log::stop();
    return 1;
  }

  boost::asio::steady_timer limit(io);
  if (opts.timeout_sec > 0) {
    limit.expires_after(std::chrono::seconds(opts.timeout_sec));
    limit.async_wait([&](boost::system::error_code ec) {
      if (ec) {
        return;
      }
      log::warn("run limit of {}s reached, cancelling", opts.timeout_sec);
      if (auto res = orchestrator.cancel_workflow(*id); !res) {
        log::error("cancel failed: {}", res.error().message());
        io.stop();
      }
    });
  }

  if (auto res = orchestrator.start_workflow(*id); !res) {
    std::println(stderr, "Error: cannot start: {}", res.error().message());
    log::stop();
    return 1;
  }
  orchestrator.scheduler().run(
      static_cast<std::size_t>(cfg->scheduler.workers));
  orchestrator.stop();

  auto status = orchestrator.get_status(*id);
  log::stop();
  if (!status) {
    std::println(stderr, "Error: {}", status.error().message());
    return 1;
  }
  if (opts.json) {
    print_json(*status);
  } else {
    print_summary(*status);
  }
  return status->status == WorkflowStatus::Completed ? 0 : 1;
}

} // namespace flowcore::cli
