#include "flowcore/config/workflow_definition.hpp"
#include "flowcore/config/toml_util.hpp"

#include "flowcore/util/log.hpp"

#include <glaze/toml.hpp>

#include <format>
#include <ranges>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace flowcore {
namespace detail {

struct DependencyToml {
  std::string step;
  std::string type{"completion"};
  std::string condition;
  bool optional{false};
};

struct StepToml {
  std::string id;
  std::string name;
  std::string type{"task"};
  int step_order{-1};
  int priority{0};
  int max_retries{-1};
  int timeout_sec{-1};

  std::string task_type;
  std::string handler;
  std::string config;
  std::string input;

  std::string predicate;
  std::vector<std::string> true_steps;
  std::vector<std::string> false_steps;
  std::vector<std::string> children;
  std::vector<std::string> body;
  int max_iterations{1};

  std::int64_t wait_ms{-1};
  std::string condition;

  std::string event;
  std::string callback_url;

  double cpu_cores{0.0};
  std::uint64_t memory_mb{0};
  bool gpu{false};
  std::uint64_t disk_mb{0};
  std::string network;

  std::vector<std::variant<std::string, DependencyToml>> dependencies;
};

struct WorkflowToml {
  std::string id;
  std::string name;
  int version{1};
  int max_parallel_steps{0};
  int timeout_sec{0};
  bool retry_failed_steps{true};
  std::string context;
  std::vector<StepToml> steps;
};

} // namespace detail
} // namespace flowcore

namespace glz {
template <> struct meta<flowcore::detail::DependencyToml> {
  using T = flowcore::detail::DependencyToml;
  static constexpr auto value =
      object("step", &T::step, "type", &T::type, "condition", &T::condition,
             "optional", &T::optional);
};

template <> struct meta<flowcore::detail::StepToml> {
  using T = flowcore::detail::StepToml;
  static constexpr auto value = object(
      "id", &T::id, "name", &T::name, "type", &T::type, "step_order",
      &T::step_order, "priority", &T::priority, "max_retries", &T::max_retries,
      "timeout_sec", &T::timeout_sec, "task_type", &T::task_type, "handler",
      &T::handler, "config", &T::config, "input", &T::input, "predicate",
      &T::predicate, "true_steps", &T::true_steps, "false_steps",
      &T::false_steps, "children", &T::children, "body", &T::body,
      "max_iterations", &T::max_iterations, "wait_ms", &T::wait_ms,
      "condition", &T::condition, "event", &T::event, "callback_url",
      &T::callback_url, "cpu_cores", &T::cpu_cores, "memory_mb",
      &T::memory_mb, "gpu", &T::gpu, "disk_mb", &T::disk_mb, "network",
      &T::network, "dependencies", &T::dependencies);
};

template <> struct meta<flowcore::detail::WorkflowToml> {
  using T = flowcore::detail::WorkflowToml;
  static constexpr auto value =
      object("id", &T::id, "name", &T::name, "version", &T::version,
             "max_parallel_steps", &T::max_parallel_steps, "timeout_sec",
             &T::timeout_sec, "retry_failed_steps", &T::retry_failed_steps,
             "context", &T::context, "steps", &T::steps);
};
} // namespace glz

namespace flowcore {
namespace {

[[nodiscard]] auto to_ids(const std::vector<std::string> &raw)
    -> std::vector<StepId> {
  std::vector<StepId> out;
  out.reserve(raw.size());
  for (const auto &id : raw) {
    out.emplace_back(id);
  }
  return out;
}

[[nodiscard]] auto parse_payload(std::string_view text, std::string_view field,
                                 const std::string &step,
                                 std::string *diagnostic) -> Result<JsonValue> {
  if (text.empty()) {
    return ok(JsonValue{});
  }
  auto value = parse_json(text);
  if (!value) {
    auto detail = std::format("step '{}': {} is not valid JSON", step, field);
    log::error("{}", detail);
    if (diagnostic) {
      *diagnostic = std::move(detail);
    }
  }
  return value;
}

[[nodiscard]] auto parse_resources(const detail::StepToml &raw)
    -> Result<std::optional<ResourceRequirement>> {
  ResourceRequirement req{.cpu_cores = raw.cpu_cores,
                          .memory_mb = raw.memory_mb,
                          .gpu = raw.gpu,
                          .disk_mb = raw.disk_mb};
  if (!raw.network.empty()) {
    auto network = util::try_parse_enum<NetworkClass>(raw.network);
    if (!network) {
      return fail(Error::InvalidArgument);
    }
    req.network = *network;
  }
  if (req.empty()) {
    return ok(std::optional<ResourceRequirement>{});
  }
  return ok(std::optional<ResourceRequirement>{std::move(req)});
}

[[nodiscard]] auto parse_config(const detail::StepToml &raw, StepType type,
                                std::string *diagnostic) -> Result<StepConfig> {
  switch (type) {
  case StepType::Task:
  case StepType::Custom: {
    auto config = parse_payload(raw.config, "config", raw.id, diagnostic);
    if (!config) {
      return fail(config.error());
    }
    auto input = parse_payload(raw.input, "input", raw.id, diagnostic);
    if (!input) {
      return fail(input.error());
    }
    if (type == StepType::Task) {
      return ok(StepConfig{TaskStepConfig{.task_type = raw.task_type,
                                          .task_config = std::move(*config),
                                          .input = std::move(*input)}});
    }
    return ok(StepConfig{CustomStepConfig{.handler = raw.handler,
                                          .config = std::move(*config),
                                          .input = std::move(*input)}});
  }
  case StepType::Condition:
    return ok(StepConfig{
        ConditionStepConfig{.predicate = raw.predicate,
                            .true_path_steps = to_ids(raw.true_steps),
                            .false_path_steps = to_ids(raw.false_steps)}});
  case StepType::Parallel:
    return ok(StepConfig{
        ParallelStepConfig{.child_step_ids = to_ids(raw.children)}});
  case StepType::Sequential:
    return ok(StepConfig{
        SequentialStepConfig{.child_step_ids = to_ids(raw.children)}});
  case StepType::Loop:
    return ok(StepConfig{LoopStepConfig{.predicate = raw.predicate,
                                        .body_step_ids = to_ids(raw.body),
                                        .max_iterations =
                                            raw.max_iterations}});
  case StepType::Wait: {
    WaitStepConfig cfg{.condition = raw.condition};
    if (raw.wait_ms >= 0) {
      cfg.duration = Duration{raw.wait_ms};
    }
    return ok(StepConfig{std::move(cfg)});
  }
  case StepType::Webhook:
    return ok(StepConfig{WebhookStepConfig{.event = raw.event,
                                           .callback_url = raw.callback_url}});
  }
  return fail(Error::InvalidArgument);
}

[[nodiscard]] auto parse_dependencies(const detail::StepToml &raw,
                                      std::vector<StepDependency> &out)
    -> Result<void> {
  const StepId self{raw.id};
  for (const auto &dep : raw.dependencies) {
    if (const auto *id = std::get_if<std::string>(&dep)) {
      if (!id->empty()) {
        out.push_back(StepDependency{.step_id = self, .depends_on = StepId{*id}});
      }
      continue;
    }
    const auto &d = std::get<detail::DependencyToml>(dep);
    auto type = util::try_parse_enum<DependencyType>(d.type);
    if (!type) {
      log::error("step '{}': unknown dependency type '{}' (expected {})",
                 raw.id, d.type, util::enum_choices<DependencyType>());
      return fail(Error::InvalidArgument);
    }
    out.push_back(StepDependency{.step_id = self,
                                 .depends_on = StepId{d.step},
                                 .type = *type,
                                 .condition_expression = d.condition,
                                 .optional = d.optional});
  }
  return ok();
}

[[nodiscard]] auto parse_step(const detail::StepToml &raw, int position,
                              const DefinitionDefaults &defaults,
                              std::string *diagnostic) -> Result<WorkflowStep> {
  auto type = util::try_parse_enum<StepType>(raw.type);
  if (!type) {
    auto detail = std::format("step '{}': unknown type '{}' (expected {})",
                              raw.id, raw.type, util::enum_choices<StepType>());
    log::error("{}", detail);
    if (diagnostic) {
      *diagnostic = std::move(detail);
    }
    return fail(Error::InvalidArgument);
  }
  auto config = parse_config(raw, *type, diagnostic);
  if (!config) {
    return fail(config.error());
  }
  auto resources = parse_resources(raw);
  if (!resources) {
    log::error("step '{}': unknown network class '{}' (expected {})", raw.id,
               raw.network, util::enum_choices<NetworkClass>());
    return fail(resources.error());
  }

  WorkflowStep step{.id = StepId{raw.id},
                    .name = raw.name.empty() ? raw.id : raw.name,
                    .step_order = raw.step_order >= 0 ? raw.step_order
                                                      : position,
                    .priority = raw.priority > 0 ? raw.priority
                                                 : defaults.priority,
                    .config = std::move(*config),
                    .resources = std::move(*resources)};
  step.lifecycle.max_retries =
      raw.max_retries >= 0 ? raw.max_retries : defaults.max_retries;
  // Containers finish with their children and waits with their duration or
  // condition, so neither gets the default timeout. Webhooks do.
  const bool timed = *type == StepType::Task || *type == StepType::Custom ||
                     *type == StepType::Loop || *type == StepType::Webhook;
  if (raw.timeout_sec >= 0) {
    step.lifecycle.timeout = std::chrono::seconds(raw.timeout_sec);
  } else if (timed) {
    step.lifecycle.timeout = defaults.step_timeout;
  }
  return ok(std::move(step));
}

[[nodiscard]] auto convert(detail::WorkflowToml &raw,
                           const DefinitionDefaults &defaults,
                           std::string *diagnostic) -> Result<WorkflowGraph> {
  WorkflowGraph graph{};
  auto &wf = graph.workflow;
  wf.id = WorkflowId{raw.id};
  wf.name = raw.name.empty() ? raw.id : raw.name;
  wf.version = raw.version;
  wf.max_parallel_steps = raw.max_parallel_steps > 0
                              ? raw.max_parallel_steps
                              : defaults.max_parallel_steps;
  wf.timeout = std::chrono::seconds(raw.timeout_sec);
  wf.retry_failed_steps = raw.retry_failed_steps;

  if (!raw.context.empty()) {
    auto context = parse_json(raw.context);
    if (!context || !context->is_object()) {
      auto detail = std::string("workflow context must be a JSON object");
      log::error("{}", detail);
      if (diagnostic) {
        *diagnostic = std::move(detail);
      }
      return fail(Error::ParseError);
    }
    wf.context = std::move(*context);
  } else {
    wf.context = make_json_object();
  }

  graph.steps.reserve(raw.steps.size());
  for (const auto &[i, raw_step] : raw.steps | std::views::enumerate) {
    auto step =
        parse_step(raw_step, static_cast<int>(i), defaults, diagnostic);
    if (!step) {
      return fail(step.error());
    }
    graph.steps.push_back(std::move(*step));
    if (auto res = parse_dependencies(raw_step, graph.dependencies); !res) {
      return fail(res.error());
    }
  }
  return ok(std::move(graph));
}

} // namespace

auto WorkflowDefinitionLoader::load_from_string(
    std::string_view toml_str, const DefinitionDefaults &defaults,
    std::string *diagnostic) -> Result<WorkflowGraph> {
  auto raw = toml_util::parse_toml<detail::WorkflowToml>(
      toml_str, "<workflow>", diagnostic);
  if (!raw) {
    return fail(raw.error());
  }
  return convert(*raw, defaults, diagnostic);
}

auto WorkflowDefinitionLoader::load_from_file(
    std::string_view path, const DefinitionDefaults &defaults,
    std::string *diagnostic) -> Result<WorkflowGraph> {
  auto raw =
      toml_util::parse_toml_file<detail::WorkflowToml>(path, diagnostic);
  if (!raw) {
    return fail(raw.error());
  }
  return convert(*raw, defaults, diagnostic);
}

} // namespace flowcore
