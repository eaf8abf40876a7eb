#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <optional>
#include <string>

namespace flowcore::util {

// 2026-01-02T03:04:05.678Z; empty for the epoch, which marks "never".
[[nodiscard]] inline auto
format_iso8601(std::chrono::system_clock::time_point tp) -> std::string {
  if (tp == std::chrono::system_clock::time_point{}) {
    return {};
  }
  return std::format("{:%FT%T}Z",
                     std::chrono::floor<std::chrono::milliseconds>(tp));
}

[[nodiscard]] inline auto
format_iso8601(const std::optional<std::chrono::system_clock::time_point> &tp)
    -> std::string {
  return tp ? format_iso8601(*tp) : std::string{};
}

// Wall time between two optional instants, when both are known.
[[nodiscard]] inline auto
elapsed_ms(const std::optional<std::chrono::system_clock::time_point> &from,
           const std::optional<std::chrono::system_clock::time_point> &to)
    -> std::optional<std::int64_t> {
  if (!from || !to) {
    return std::nullopt;
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(*to - *from)
      .count();
}

} // namespace flowcore::util
