#include "flowcore/util/id.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <format>
#include <random>

namespace flowcore::detail {

auto generate_id(std::string_view prefix) -> std::string {
  static std::atomic<std::uint32_t> sequence{0};
  thread_local std::mt19937 gen(std::random_device{}());
  const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
  const auto seq = sequence.fetch_add(1, std::memory_order_relaxed);
  return std::format("{}{:012x}{:06x}{:08x}", prefix,
                     static_cast<std::uint64_t>(now_ms), seq & 0xFFFFFFu,
                     gen());
}

} // namespace flowcore::detail
