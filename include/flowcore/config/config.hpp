#pragma once

#include "flowcore/config/system_config.hpp"
#include "flowcore/core/error.hpp"
#include "flowcore/orchestrator/workflow_orchestrator.hpp"

#include <string_view>

namespace flowcore {

class ConfigLoader {
public:
  // Both apply FLOWCORE_* environment overrides and validate the result.
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<SystemConfig>;

  // Defaults plus environment overrides, for runs without a config file.
  [[nodiscard]] static auto load_defaults() -> Result<SystemConfig>;
};

[[nodiscard]] auto to_orchestrator_options(const SystemConfig &cfg)
    -> OrchestratorOptions;

} // namespace flowcore
