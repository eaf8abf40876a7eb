#include "flowcore/config/config.hpp"
#include "flowcore/config/toml_util.hpp"

#include "flowcore/util/log.hpp"

#include <boost/lexical_cast.hpp>

#include <cstdlib>
#include <string>
#include <string_view>

namespace flowcore {
namespace detail {

struct SchedulerToml {
  int tick_interval_ms{100};
  int workers{1};
};

struct LogToml {
  std::string level{"info"};
  std::string file;
};

struct ResourcesToml {
  double cpu_cores{8.0};
  std::uint64_t memory_mb{16384};
  std::uint32_t gpu_slots{0};
  std::uint64_t disk_mb{102400};
  std::uint32_t network_low{16};
  std::uint32_t network_standard{8};
  std::uint32_t network_high{2};
};

struct RetryToml {
  std::int64_t base_delay_ms{1000};
  std::int64_t max_delay_ms{300000};
};

struct DefaultsToml {
  int step_timeout_sec{300};
  int max_retries{3};
  int max_parallel_steps{4};
  int priority{3};
};

struct SystemToml {
  SchedulerToml scheduler{};
  LogToml log{};
  ResourcesToml resources{};
  RetryToml retry{};
  DefaultsToml defaults{};
};

} // namespace detail
} // namespace flowcore

namespace glz {
template <> struct meta<flowcore::detail::SchedulerToml> {
  using T = flowcore::detail::SchedulerToml;
  static constexpr auto value = object(
      "tick_interval_ms", &T::tick_interval_ms, "workers", &T::workers);
};

template <> struct meta<flowcore::detail::LogToml> {
  using T = flowcore::detail::LogToml;
  static constexpr auto value = object("level", &T::level, "file", &T::file);
};

template <> struct meta<flowcore::detail::ResourcesToml> {
  using T = flowcore::detail::ResourcesToml;
  static constexpr auto value =
      object("cpu_cores", &T::cpu_cores, "memory_mb", &T::memory_mb,
             "gpu_slots", &T::gpu_slots, "disk_mb", &T::disk_mb,
             "network_low", &T::network_low, "network_standard",
             &T::network_standard, "network_high", &T::network_high);
};

template <> struct meta<flowcore::detail::RetryToml> {
  using T = flowcore::detail::RetryToml;
  static constexpr auto value = object(
      "base_delay_ms", &T::base_delay_ms, "max_delay_ms", &T::max_delay_ms);
};

template <> struct meta<flowcore::detail::DefaultsToml> {
  using T = flowcore::detail::DefaultsToml;
  static constexpr auto value =
      object("step_timeout_sec", &T::step_timeout_sec, "max_retries",
             &T::max_retries, "max_parallel_steps", &T::max_parallel_steps,
             "priority", &T::priority);
};

template <> struct meta<flowcore::detail::SystemToml> {
  using T = flowcore::detail::SystemToml;
  static constexpr auto value =
      object("scheduler", &T::scheduler, "log", &T::log, "resources",
             &T::resources, "retry", &T::retry, "defaults", &T::defaults);
};
} // namespace glz

namespace flowcore {
namespace {

template <typename T>
auto env_override(const char *name, T &target) -> Result<void> {
  const char *v = std::getenv(name);
  if (v == nullptr) {
    return ok();
  }
  try {
    target = boost::lexical_cast<T>(v);
  } catch (const boost::bad_lexical_cast &) {
    log::error("invalid value '{}' for {}", v, name);
    return fail(Error::ParseError);
  }
  return ok();
}

[[nodiscard]] auto apply_env(SystemConfig &cfg) -> Result<void> {
  return env_override("FLOWCORE_TICK_INTERVAL_MS",
                      cfg.scheduler.tick_interval_ms)
      .and_then([&] {
        return env_override("FLOWCORE_WORKERS", cfg.scheduler.workers);
      })
      .and_then([&] { return env_override("FLOWCORE_LOG_LEVEL", cfg.log.level); })
      .and_then([&] { return env_override("FLOWCORE_LOG_FILE", cfg.log.file); })
      .and_then([&] {
        return env_override("FLOWCORE_CPU_CORES", cfg.resources.cpu_cores);
      })
      .and_then([&] {
        return env_override("FLOWCORE_MEMORY_MB", cfg.resources.memory_mb);
      })
      .and_then([&] {
        return env_override("FLOWCORE_GPU_SLOTS", cfg.resources.gpu_slots);
      })
      .and_then([&] {
        return env_override("FLOWCORE_RETRY_BASE_MS", cfg.retry.base_delay_ms);
      })
      .and_then([&] {
        return env_override("FLOWCORE_RETRY_MAX_MS", cfg.retry.max_delay_ms);
      });
}

[[nodiscard]] auto validate(const SystemConfig &cfg) -> Result<void> {
  auto reject = [](std::string_view what) {
    log::error("invalid configuration: {}", what);
    return fail(Error::ParseError);
  };
  if (cfg.scheduler.tick_interval_ms <= 0) {
    return reject("scheduler.tick_interval_ms must be positive");
  }
  if (cfg.scheduler.workers <= 0) {
    return reject("scheduler.workers must be positive");
  }
  if (!log::parse_level(cfg.log.level)) {
    return reject("log.level is not a known level");
  }
  if (cfg.resources.cpu_cores < 0.0) {
    return reject("resources.cpu_cores must not be negative");
  }
  if (cfg.retry.base_delay_ms < 0 ||
      cfg.retry.max_delay_ms < cfg.retry.base_delay_ms) {
    return reject("retry.max_delay_ms must be >= retry.base_delay_ms >= 0");
  }
  const auto &d = cfg.defaults;
  if (d.step_timeout_sec < 0 || d.max_retries < 0 ||
      d.max_parallel_steps < 1 || d.priority < node_defaults::kMinPriority ||
      d.priority > node_defaults::kMaxPriority) {
    return reject("defaults out of range");
  }
  return ok();
}

[[nodiscard]] auto finish(SystemConfig cfg) -> Result<SystemConfig> {
  return apply_env(cfg).and_then([&] { return validate(cfg); }).transform([&] {
    return std::move(cfg);
  });
}

[[nodiscard]] auto convert(detail::SystemToml raw) -> Result<SystemConfig> {
  SystemConfig cfg{};
  cfg.scheduler.tick_interval_ms = raw.scheduler.tick_interval_ms;
  cfg.scheduler.workers = raw.scheduler.workers;

  cfg.log.level = std::move(raw.log.level);
  cfg.log.file = std::move(raw.log.file);

  cfg.resources.cpu_cores = raw.resources.cpu_cores;
  cfg.resources.memory_mb = raw.resources.memory_mb;
  cfg.resources.gpu_slots = raw.resources.gpu_slots;
  cfg.resources.disk_mb = raw.resources.disk_mb;
  cfg.resources.network_low = raw.resources.network_low;
  cfg.resources.network_standard = raw.resources.network_standard;
  cfg.resources.network_high = raw.resources.network_high;

  cfg.retry.base_delay_ms = raw.retry.base_delay_ms;
  cfg.retry.max_delay_ms = raw.retry.max_delay_ms;

  cfg.defaults.step_timeout_sec = raw.defaults.step_timeout_sec;
  cfg.defaults.max_retries = raw.defaults.max_retries;
  cfg.defaults.max_parallel_steps = raw.defaults.max_parallel_steps;
  cfg.defaults.priority = raw.defaults.priority;

  return finish(std::move(cfg));
}

} // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  return toml_util::parse_toml_file<detail::SystemToml>(path).and_then(
      convert);
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<SystemConfig> {
  return toml_util::parse_toml<detail::SystemToml>(toml_str, "<config>")
      .and_then(convert);
}

auto ConfigLoader::load_defaults() -> Result<SystemConfig> {
  return finish(SystemConfig{});
}

auto to_orchestrator_options(const SystemConfig &cfg) -> OrchestratorOptions {
  const auto &r = cfg.resources;
  return OrchestratorOptions{
      .tick_interval = Duration{cfg.scheduler.tick_interval_ms},
      .budget = ResourceBudget{.cpu_cores = r.cpu_cores,
                               .memory_mb = r.memory_mb,
                               .gpu_slots = r.gpu_slots,
                               .disk_mb = r.disk_mb,
                               .network_slots = {r.network_low,
                                                 r.network_standard,
                                                 r.network_high}},
      .retry = RetryManager::Policy{
          .base_delay = Duration{cfg.retry.base_delay_ms},
          .max_delay = Duration{cfg.retry.max_delay_ms}}};
}

} // namespace flowcore
