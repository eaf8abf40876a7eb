#include "flowcore/resource/resource_allocator.hpp"

#include "flowcore/util/log.hpp"

#include <utility>

namespace flowcore {

namespace {

[[nodiscard]] auto network_index(NetworkClass c) noexcept -> std::size_t {
  return static_cast<std::size_t>(std::to_underlying(c));
}

auto apply(ResourceBudget &used, const ResourceRequirement &req, int sign)
    -> void {
  used.cpu_cores += sign * req.cpu_cores;
  if (sign > 0) {
    used.memory_mb += req.memory_mb;
    used.disk_mb += req.disk_mb;
    used.gpu_slots += req.gpu ? 1 : 0;
    if (req.network) {
      ++used.network_slots[network_index(*req.network)];
    }
  } else {
    used.memory_mb -= req.memory_mb;
    used.disk_mb -= req.disk_mb;
    used.gpu_slots -= req.gpu ? 1 : 0;
    if (req.network) {
      --used.network_slots[network_index(*req.network)];
    }
  }
  for (const auto &[name, amount] : req.custom) {
    used.custom[name] += sign * amount;
  }
}

} // namespace

ResourceAllocator::ResourceAllocator(ResourceBudget budget)
    : capacity_(std::move(budget)) {}

auto ResourceAllocator::fits(const ResourceRequirement &req) const -> bool {
  constexpr double kEpsilon = 1e-9;
  if (used_.cpu_cores + req.cpu_cores > capacity_.cpu_cores + kEpsilon) {
    return false;
  }
  if (used_.memory_mb + req.memory_mb > capacity_.memory_mb ||
      used_.disk_mb + req.disk_mb > capacity_.disk_mb) {
    return false;
  }
  if (req.gpu && used_.gpu_slots + 1 > capacity_.gpu_slots) {
    return false;
  }
  if (req.network) {
    auto i = network_index(*req.network);
    if (used_.network_slots[i] + 1 > capacity_.network_slots[i]) {
      return false;
    }
  }
  for (const auto &[name, amount] : req.custom) {
    auto cap = capacity_.custom.find(name);
    if (cap == capacity_.custom.end()) {
      continue;
    }
    auto used = used_.custom.find(name);
    const double current = used != used_.custom.end() ? used->second : 0.0;
    if (current + amount > cap->second + kEpsilon) {
      return false;
    }
  }
  return true;
}

auto ResourceAllocator::try_admit(const ResourceRequirement &req)
    -> Result<AdmissionToken> {
  std::scoped_lock lock(mu_);
  if (!fits(req)) {
    log::debug("admission deferred: cpu {:.2f}/{:.2f} mem {}/{}MB gpu {}/{}",
               used_.cpu_cores, capacity_.cpu_cores, used_.memory_mb,
               capacity_.memory_mb, used_.gpu_slots, capacity_.gpu_slots);
    return fail(Error::ResourceExhausted);
  }
  apply(used_, req, +1);
  auto token = next_token_++;
  grants_.emplace(token, req);
  return ok(token);
}

auto ResourceAllocator::release(AdmissionToken token) -> Result<void> {
  std::scoped_lock lock(mu_);
  auto it = grants_.find(token);
  if (it == grants_.end()) {
    return fail(Error::NotFound);
  }
  apply(used_, it->second, -1);
  grants_.erase(it);
  return ok();
}

auto ResourceAllocator::available() const -> ResourceBudget {
  std::scoped_lock lock(mu_);
  ResourceBudget out = capacity_;
  out.cpu_cores -= used_.cpu_cores;
  out.memory_mb -= used_.memory_mb;
  out.gpu_slots -= used_.gpu_slots;
  out.disk_mb -= used_.disk_mb;
  for (std::size_t i = 0; i < out.network_slots.size(); ++i) {
    out.network_slots[i] -= used_.network_slots[i];
  }
  for (auto &[name, cap] : out.custom) {
    if (auto used = used_.custom.find(name); used != used_.custom.end()) {
      cap -= used->second;
    }
  }
  return out;
}

auto ResourceAllocator::in_use() const -> ResourceBudget {
  std::scoped_lock lock(mu_);
  return used_;
}

auto ResourceAllocator::outstanding() const -> std::size_t {
  std::scoped_lock lock(mu_);
  return grants_.size();
}

} // namespace flowcore
