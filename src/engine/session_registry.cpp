#include "session_registry.hpp"

namespace tessera {

uint64_t SessionRegistry::register_session() {
  std::lock_guard<std::mutex> lk(mtx_);
  uint64_t h = next_handle_++;
  live_.insert(h);
  return h;
}

bool SessionRegistry::unregister_session(uint64_t handle) {
  std::lock_guard<std::mutex> lk(mtx_);
  return live_.erase(handle) == 1;
}

bool SessionRegistry::contains(uint64_t handle) const {
  std::lock_guard<std::mutex> lk(mtx_);
  return live_.count(handle) == 1;
}

size_t SessionRegistry::active() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return live_.size();
}

} // namespace tessera
