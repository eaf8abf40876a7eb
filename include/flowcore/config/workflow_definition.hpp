#pragma once

#include "flowcore/config/system_config.hpp"
#include "flowcore/core/error.hpp"
#include "flowcore/model/workflow.hpp"

#include <string>
#include <string_view>

namespace flowcore {

// Values applied to fields a definition file leaves out.
struct DefinitionDefaults {
  Duration step_timeout{node_defaults::kStepTimeout};
  int max_retries{node_defaults::kMaxRetries};
  int max_parallel_steps{4};
  int priority{node_defaults::kPriority};

  [[nodiscard]] static auto from(const DefaultsConfig &cfg)
      -> DefinitionDefaults {
    return DefinitionDefaults{
        .step_timeout = std::chrono::seconds(cfg.step_timeout_sec),
        .max_retries = cfg.max_retries,
        .max_parallel_steps = cfg.max_parallel_steps,
        .priority = cfg.priority};
  }
};

// Reads a workflow from TOML:
//
//   id = "etl"
//   context = '{"x": 5}'
//
//   [[steps]]
//   id = "fetch"
//   type = "task"
//   task_type = "shell"
//   config = '{"command": "echo 1"}'
//   dependencies = ["prepare", { step = "poll", type = "data" }]
//
// JSON payloads (context, config, input) are embedded as strings. The result
// is a draft graph; structural validation happens in create_workflow().
class WorkflowDefinitionLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path,
                                           const DefinitionDefaults &defaults =
                                               {},
                                           std::string *diagnostic = nullptr)
      -> Result<WorkflowGraph>;
  [[nodiscard]] static auto
  load_from_string(std::string_view toml_str,
                   const DefinitionDefaults &defaults = {},
                   std::string *diagnostic = nullptr) -> Result<WorkflowGraph>;
};

} // namespace flowcore
