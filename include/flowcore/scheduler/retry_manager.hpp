#pragma once

#include "flowcore/model/node.hpp"
#include "flowcore/model/status.hpp"

#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>

namespace flowcore {

enum class TimeVerdict : std::uint8_t { None, Timeout, DeadlineExceeded };

// Exponential backoff and the per-tick timeout/deadline check. Stateless
// apart from its policy, so one instance serves every workflow.
class RetryManager {
public:
  struct Policy {
    Duration base_delay{std::chrono::seconds(1)};
    Duration max_delay{std::chrono::minutes(5)};
  };

  RetryManager() = default;
  explicit RetryManager(Policy policy) : policy_(policy) {}

  // min(base * 2^retry_count, max_delay)
  [[nodiscard]] auto backoff(int retry_count) const noexcept -> Duration {
    auto shift = static_cast<unsigned>(retry_count < 0 ? 0 : retry_count);
    if (shift > 30) {
      shift = 30;
    }
    const auto base = policy_.base_delay.count();
    if (base > 0 &&
        base > (std::numeric_limits<std::int64_t>::max() >> shift)) {
      return policy_.max_delay;
    }
    const auto delay = Duration{base * (std::int64_t{1} << shift)};
    return delay > policy_.max_delay ? policy_.max_delay : delay;
  }

  // Delay to pass to StateMachine::fail, or nullopt when the node must not be
  // retried.
  [[nodiscard]] auto retry_delay(const NodeLifecycle &node,
                                 bool retries_enabled) const noexcept
      -> std::optional<Duration> {
    if (!retries_enabled || node.retry_count >= node.max_retries) {
      return std::nullopt;
    }
    return backoff(node.retry_count);
  }

  // Deadlines win over timeouts and apply to any non-terminal status;
  // timeouts only to the running attempt.
  [[nodiscard]] auto check(TimePoint now, const NodeLifecycle &node) const
      -> TimeVerdict {
    if (is_terminal(node.status)) {
      return TimeVerdict::None;
    }
    if (node.deadline && *node.deadline <= now) {
      return TimeVerdict::DeadlineExceeded;
    }
    if (node.status == NodeStatus::Running && node.timeout.count() > 0 &&
        node.attempt_started_at &&
        now - *node.attempt_started_at >= node.timeout) {
      return TimeVerdict::Timeout;
    }
    return TimeVerdict::None;
  }

  // A retrying node is due once its scheduled_at has passed.
  [[nodiscard]] static auto due(TimePoint now, const NodeLifecycle &node)
      -> bool {
    return node.status == NodeStatus::Retrying &&
           (!node.scheduled_at || *node.scheduled_at <= now);
  }

  [[nodiscard]] auto policy() const noexcept -> const Policy & {
    return policy_;
  }

private:
  Policy policy_;
};

} // namespace flowcore
