#include "config.hpp"
#include <cstdio>

namespace tessera {

bool validate(const SessionConfig &cfg, std::string &why) {
  if (cfg.symbol_size == 0) {
    why = "symbol size must be between 1 and 65535";
    return false;
  }
  if (cfg.redundancy_factor == 0) {
    why = "redundancy factor must be positive";
    return false;
  }
  if (cfg.memory_budget == 0) {
    why = "memory budget must be non-zero";
    return false;
  }
  if (cfg.concurrency_limit == 0) {
    why = "concurrency limit must be non-zero";
    return false;
  }
  return true;
}

std::string describe(const SessionConfig &cfg) {
  char buf[160];
  std::snprintf(buf, sizeof(buf),
                "symbol_size=%u redundancy=%u memory=%llu concurrency=%u",
                (unsigned)cfg.symbol_size, (unsigned)cfg.redundancy_factor,
                (unsigned long long)cfg.memory_budget,
                (unsigned)cfg.concurrency_limit);
  return buf;
}

} // namespace tessera
