#pragma once

#include <optional>
#include <string>

namespace flowcore::cli {

struct ValidateOptions {
  std::string file;
  std::string config_file;
  bool json{false};
};

struct RunOptions {
  std::string file;
  std::string config_file;
  std::string context;      // JSON object merged over the file's context
  std::string log_level;    // overrides the config
  int timeout_sec{0};       // 0 = wait for the workflow to settle
  bool json{false};
};

[[nodiscard]] auto cmd_validate(const ValidateOptions &opts) -> int;
[[nodiscard]] auto cmd_run(const RunOptions &opts) -> int;

} // namespace flowcore::cli
