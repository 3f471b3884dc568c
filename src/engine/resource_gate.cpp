#include "resource_gate.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <algorithm>

namespace tessera {

ResourceGate::Lease &ResourceGate::Lease::operator=(Lease &&o) noexcept {
  if (this != &o) {
    release();
    gate_ = o.gate_;
    bytes_ = o.bytes_;
    o.gate_ = nullptr;
  }
  return *this;
}

void ResourceGate::Lease::release() {
  if (gate_) {
    gate_->release(bytes_);
    gate_ = nullptr;
  }
}

ResourceGate::ResourceGate(uint32_t slots, uint64_t budget,
                           std::chrono::milliseconds timeout)
    : slots_(slots), budget_(budget), timeout_(timeout) {}

std::error_code ResourceGate::acquire(uint64_t bytes, Lease &lease,
                                      std::string &detail) {
  lease.release();
  if (bytes > budget_) {
    detail = "block needs an estimated " + std::to_string(bytes) +
             " bytes, budget is " + std::to_string(budget_);
    return errc::memory_budget_exceeded;
  }
  std::unique_lock<std::mutex> lk(mtx_);
  auto fits = [&] {
    return stats_.in_flight < slots_ && stats_.bytes_in_use + bytes <= budget_;
  };
  if (!cv_.wait_for(lk, timeout_, fits)) {
    if (stats_.in_flight >= slots_) {
      detail = "all " + std::to_string(slots_) +
               " block slots busy, retry later";
      return errc::concurrency_limit_exceeded;
    }
    detail = std::to_string(stats_.bytes_in_use) + " of " +
             std::to_string(budget_) + " budget bytes in use, " +
             std::to_string(bytes) + " more requested";
    return errc::memory_budget_exceeded;
  }
  stats_.in_flight++;
  stats_.bytes_in_use += bytes;
  stats_.admitted++;
  stats_.peak_in_flight = std::max(stats_.peak_in_flight, stats_.in_flight);
  stats_.peak_bytes = std::max(stats_.peak_bytes, stats_.bytes_in_use);
  lease = Lease(this, bytes);
  return {};
}

void ResourceGate::release(uint64_t bytes) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    stats_.in_flight--;
    stats_.bytes_in_use -= bytes;
  }
  cv_.notify_all();
}

ResourceGate::Stats ResourceGate::stats() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return stats_;
}

} // namespace tessera
