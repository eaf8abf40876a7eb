#pragma once

#include <cstdint>
#include <string>

namespace flowcore {

struct SchedulerConfig {
  int tick_interval_ms{100};
  int workers{1};

  auto operator==(const SchedulerConfig &) const -> bool = default;
};

struct LogConfig {
  std::string level{"info"};
  std::string file; // empty = stdout

  auto operator==(const LogConfig &) const -> bool = default;
};

// Admission budget. A zero capacity admits nothing that requests the
// dimension.
struct ResourcesConfig {
  double cpu_cores{8.0};
  std::uint64_t memory_mb{16384};
  std::uint32_t gpu_slots{0};
  std::uint64_t disk_mb{102400};
  std::uint32_t network_low{16};
  std::uint32_t network_standard{8};
  std::uint32_t network_high{2};

  auto operator==(const ResourcesConfig &) const -> bool = default;
};

struct RetryConfig {
  std::int64_t base_delay_ms{1000};
  std::int64_t max_delay_ms{300000};

  auto operator==(const RetryConfig &) const -> bool = default;
};

// Applied by the workflow definition loader to fields a file leaves out.
struct DefaultsConfig {
  int step_timeout_sec{300};
  int max_retries{3};
  int max_parallel_steps{4};
  int priority{3};

  auto operator==(const DefaultsConfig &) const -> bool = default;
};

struct SystemConfig {
  SchedulerConfig scheduler;
  LogConfig log;
  ResourcesConfig resources;
  RetryConfig retry;
  DefaultsConfig defaults;

  auto operator==(const SystemConfig &) const -> bool = default;
};

} // namespace flowcore
