#include "flowcore/config/config.hpp"

#include "test_utils.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>

#include "gtest/gtest.h"

using namespace flowcore;
using namespace std::chrono_literals;

namespace {

// Sets an environment variable for the lifetime of the guard.
class ScopedEnv {
public:
  ScopedEnv(const char *name, const char *value) : name_(name) {
    ::setenv(name, value, 1);
  }
  ~ScopedEnv() { ::unsetenv(name_); }
  ScopedEnv(const ScopedEnv &) = delete;
  auto operator=(const ScopedEnv &) -> ScopedEnv & = delete;

private:
  const char *name_;
};

} // namespace

TEST(ConfigTest, SchedulerDefaults) {
  SchedulerConfig cfg;
  EXPECT_EQ(cfg.tick_interval_ms, 100);
  EXPECT_EQ(cfg.workers, 1);
}

TEST(ConfigTest, DefaultsConfigMatchesNodeDefaults) {
  DefaultsConfig cfg;
  EXPECT_EQ(cfg.max_retries, node_defaults::kMaxRetries);
  EXPECT_EQ(cfg.priority, node_defaults::kPriority);
  EXPECT_EQ(std::chrono::seconds(cfg.step_timeout_sec),
            node_defaults::kStepTimeout);
}

TEST(ConfigTest, LoadDefaultsWithoutEnvironment) {
  auto cfg = ConfigLoader::load_defaults();
  ASSERT_TRUE(cfg.has_value()) << cfg.error().message();
  EXPECT_EQ(*cfg, SystemConfig{});
}

TEST(ConfigTest, LoadFromTomlString) {
  auto result = ConfigLoader::load_from_string(R"(
[scheduler]
tick_interval_ms = 25
workers = 2

[log]
level = "debug"

[resources]
cpu_cores = 2.5
memory_mb = 2048
gpu_slots = 1
network_high = 4

[retry]
base_delay_ms = 50
max_delay_ms = 2000

[defaults]
max_retries = 1
max_parallel_steps = 8
)");
  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ(result->scheduler.tick_interval_ms, 25);
  EXPECT_EQ(result->scheduler.workers, 2);
  EXPECT_EQ(result->log.level, "debug");
  EXPECT_DOUBLE_EQ(result->resources.cpu_cores, 2.5);
  EXPECT_EQ(result->resources.memory_mb, 2048);
  EXPECT_EQ(result->resources.network_high, 4);
  EXPECT_EQ(result->resources.network_low, ResourcesConfig{}.network_low);
  EXPECT_EQ(result->defaults.max_retries, 1);
  EXPECT_EQ(result->defaults.priority, 3);
}

TEST(ConfigTest, UnknownKeysAreIgnored) {
  auto result = ConfigLoader::load_from_string(R"(
[scheduler]
tick_interval_ms = 10
future_knob = true
)");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->scheduler.tick_interval_ms, 10);
}

TEST(ConfigTest, InvalidValuesAreRejected) {
  for (const char *toml : {"[scheduler]\ntick_interval_ms = 0\n",
                           "[log]\nlevel = \"chatty\"\n",
                           "[retry]\nbase_delay_ms = 10\nmax_delay_ms = 5\n",
                           "[defaults]\npriority = 9\n",
                           "[defaults]\nmax_parallel_steps = 0\n"}) {
    auto result = ConfigLoader::load_from_string(toml);
    ASSERT_FALSE(result.has_value()) << toml;
    EXPECT_EQ(result.error(), make_error_code(Error::ParseError)) << toml;
  }
}

TEST(ConfigTest, MalformedTomlIsParseError) {
  auto result = ConfigLoader::load_from_string("[scheduler\nworkers = ");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, EnvironmentOverridesFile) {
  ScopedEnv tick("FLOWCORE_TICK_INTERVAL_MS", "40");
  ScopedEnv level("FLOWCORE_LOG_LEVEL", "warn");
  auto result =
      ConfigLoader::load_from_string("[scheduler]\ntick_interval_ms = 25\n");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->scheduler.tick_interval_ms, 40);
  EXPECT_EQ(result->log.level, "warn");
}

TEST(ConfigTest, UnparsableEnvironmentValueFails) {
  ScopedEnv cpu("FLOWCORE_CPU_CORES", "lots");
  auto result = ConfigLoader::load_defaults();
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, LoadFromFile) {
  const auto path = test::make_temp_path("flowcore_config_");
  {
    std::ofstream out(path);
    out << "[resources]\ncpu_cores = 3.0\n";
  }
  auto result = ConfigLoader::load_from_file(path);
  std::remove(path.c_str());
  ASSERT_TRUE(result.has_value());
  EXPECT_DOUBLE_EQ(result->resources.cpu_cores, 3.0);

  auto missing = ConfigLoader::load_from_file("/nonexistent/flowcore.toml");
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), make_error_code(Error::FileNotFound));
}

TEST(ConfigTest, OrchestratorOptionsFromConfig) {
  SystemConfig cfg;
  cfg.scheduler.tick_interval_ms = 20;
  cfg.resources.cpu_cores = 2.0;
  cfg.resources.network_standard = 3;
  cfg.retry.base_delay_ms = 5;
  cfg.retry.max_delay_ms = 50;

  auto opts = to_orchestrator_options(cfg);
  EXPECT_EQ(opts.tick_interval, 20ms);
  EXPECT_DOUBLE_EQ(opts.budget.cpu_cores, 2.0);
  EXPECT_EQ(opts.budget.network_slots[1], 3);
  EXPECT_EQ(opts.retry.base_delay, 5ms);
  EXPECT_EQ(opts.retry.max_delay, 50ms);
}
