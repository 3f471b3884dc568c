#pragma once
#include <cstdint>
#include <string>

namespace tessera {

constexpr uint16_t kDefaultSymbolSize = 65535;
constexpr uint8_t kDefaultRedundancyFactor = 4;
constexpr uint64_t kDefaultMemoryBudget = 16ull * 1024 * 1024 * 1024;
constexpr uint64_t kMemoryBudget4GiB = 4ull * 1024 * 1024 * 1024;
constexpr uint32_t kDefaultConcurrencyLimit = 4;
constexpr uint32_t kDefaultAcquireTimeoutMs = 30000;

struct SessionConfig {
    uint16_t symbol_size{kDefaultSymbolSize};
    uint8_t redundancy_factor{kDefaultRedundancyFactor}; // repair symbols per source symbol
    uint64_t memory_budget{kDefaultMemoryBudget};        // bytes
    uint32_t concurrency_limit{kDefaultConcurrencyLimit};
    uint32_t acquire_timeout_ms{kDefaultAcquireTimeoutMs};
};

bool validate(const SessionConfig& cfg, std::string& why);
std::string describe(const SessionConfig& cfg);

} // namespace tessera
