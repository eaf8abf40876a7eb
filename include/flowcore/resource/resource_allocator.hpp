#pragma once

#include "flowcore/core/error.hpp"
#include "flowcore/model/node.hpp"
#include "flowcore/util/string_hash.hpp"

#include <array>
#include <cstdint>
#include <flat_map>
#include <mutex>
#include <string>

namespace flowcore {

struct ResourceBudget {
  double cpu_cores{0.0};
  std::uint64_t memory_mb{0};
  std::uint32_t gpu_slots{0};
  std::uint64_t disk_mb{0};
  // Concurrent slots per NetworkClass, indexed by its underlying value.
  std::array<std::uint32_t, 3> network_slots{};
  std::flat_map<std::string, double> custom;
};

using AdmissionToken = std::uint64_t;

// Greedy all-or-nothing admission over a fixed budget. A requirement is
// admitted only if every requested dimension fits; nothing is reserved on
// failure. Custom dimensions without a configured capacity are unconstrained.
class ResourceAllocator {
public:
  explicit ResourceAllocator(ResourceBudget budget);

  [[nodiscard]] auto try_admit(const ResourceRequirement &req)
      -> Result<AdmissionToken>;
  auto release(AdmissionToken token) -> Result<void>;

  [[nodiscard]] auto capacity() const noexcept -> const ResourceBudget & {
    return capacity_;
  }
  [[nodiscard]] auto available() const -> ResourceBudget;
  [[nodiscard]] auto in_use() const -> ResourceBudget;
  [[nodiscard]] auto outstanding() const -> std::size_t;

private:
  [[nodiscard]] auto fits(const ResourceRequirement &req) const -> bool;

  ResourceBudget capacity_;
  mutable std::mutex mu_;
  ResourceBudget used_;
  ankerl::unordered_dense::map<AdmissionToken, ResourceRequirement> grants_;
  AdmissionToken next_token_{1};
};

} // namespace flowcore
