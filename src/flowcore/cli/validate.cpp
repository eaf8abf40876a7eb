#include "flowcore/cli/commands.hpp"

#include "flowcore/config/config.hpp"
#include "flowcore/config/workflow_definition.hpp"
#include "flowcore/graph/dependency_resolver.hpp"
#include "flowcore/orchestrator/workflow_validator.hpp"
#include "flowcore/util/json.hpp"
#include "flowcore/util/log.hpp"

#include <print>
#include <ranges>
#include <string_view>
#include <vector>

namespace flowcore::cli {

namespace {

[[nodiscard]] auto load_defaults(const std::string &config_file)
    -> Result<DefinitionDefaults> {
  auto cfg = config_file.empty() ? ConfigLoader::load_defaults()
                                 : ConfigLoader::load_from_file(config_file);
  if (!cfg) {
    return fail(cfg.error());
  }
  return ok(DefinitionDefaults::from(cfg->defaults));
}

} // namespace

auto cmd_validate(const ValidateOptions &opts) -> int {
  log::set_output_stderr();
  auto defaults = load_defaults(opts.config_file);
  if (!defaults) {
    std::println(stderr, "Error: config: {}", defaults.error().message());
    return 1;
  }

  std::string diagnostic;
  auto graph =
      WorkflowDefinitionLoader::load_from_file(opts.file, *defaults, &diagnostic);
  if (!graph) {
    std::println(stderr, "Error: {}",
                 diagnostic.empty() ? graph.error().message() : diagnostic);
    return 1;
  }

  const auto issues = collect_issues(*graph);
  if (opts.json) {
    auto out = make_json_object();
    out.get_object().insert_or_assign("file", opts.file);
    out.get_object().insert_or_assign("valid", issues.empty());
    auto list = make_json_array();
    for (const auto &issue : issues) {
      list.get_array().push_back(
          JsonValue{{"step", issue.step.str()}, {"error", issue.message}});
    }
    out.get_object().insert_or_assign("issues", std::move(list));
    std::println("{}", dump_json(out));
    return issues.empty() ? 0 : 1;
  }

  if (!issues.empty()) {
    std::println(stderr, "{}: invalid", opts.file);
    for (const auto &issue : issues) {
      if (issue.step.empty()) {
        std::println(stderr, "  - {}", issue.message);
      } else {
        std::println(stderr, "  - {}: {}", issue.step, issue.message);
      }
    }
    return 1;
  }

  auto resolver = DependencyResolver::from_graph(*graph);
  if (!resolver) {
    std::println(stderr, "Error: {}", resolver.error().message());
    return 1;
  }
  std::println("{}: ok ({} steps, {} edges)", opts.file, graph->steps.size(),
               resolver->graph().edge_count());
  for (auto idx : resolver->graph().topological_order()) {
    const auto &step = graph->steps[idx];
    std::vector<std::string> upstream;
    for (auto up : resolver->upstream_of(idx)) {
      upstream.push_back(graph->steps[up].id.str());
    }
    const auto deps = upstream |
                      std::views::join_with(std::string_view(", ")) |
                      std::ranges::to<std::string>();
    std::println("  {:<20} {:<10} <- [{}]", step.id, step.type(), deps);
  }
  return 0;
}

} // namespace flowcore::cli
