#include "block_planner.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <algorithm>

namespace tessera {

uint64_t padded_symbol_width(const SessionConfig &cfg) {
  return (uint64_t)cfg.symbol_size + (cfg.symbol_size & 1);
}

uint64_t estimate_block_peak(const SessionConfig &cfg, uint64_t block_size) {
  uint64_t k = div_ceil(block_size, cfg.symbol_size);
  return block_size +
         k * padded_symbol_width(cfg) * (1 + (uint64_t)cfg.redundancy_factor);
}

uint64_t recommend_block_size(const SessionConfig &cfg, uint64_t file_size,
                              const SymbolCodec &codec) {
  const uint64_t r = cfg.redundancy_factor;
  const uint64_t per_worker = cfg.memory_budget / cfg.concurrency_limit;
  const uint64_t per_symbol = padded_symbol_width(cfg) * (2 + r);

  uint64_t k = kMaxSourceSymbolsPerBlock;
  k = std::min<uint64_t>(k, codec.preferred_max_source_symbols());
  k = std::min<uint64_t>(k, per_worker / per_symbol);
  k = std::min<uint64_t>(k, codec.max_symbols() / (1 + r));
  k = std::max<uint64_t>(k, 1);

  const uint64_t natural = k * cfg.symbol_size;
  if (file_size <= natural) {
    Logger::instance().log(LogLevel::DEBUG,
                           "plan: %llu bytes fit one block of %llu",
                           (unsigned long long)file_size,
                           (unsigned long long)natural);
    return natural;
  }
  const uint64_t blocks = div_ceil(file_size, natural);
  uint64_t size = div_ceil(file_size, blocks);
  size = div_ceil(size, cfg.symbol_size) * cfg.symbol_size;
  Logger::instance().log(LogLevel::DEBUG,
                         "plan: %llu bytes -> %llu blocks of %llu",
                         (unsigned long long)file_size,
                         (unsigned long long)blocks, (unsigned long long)size);
  return size;
}

std::error_code check_block_size(const SessionConfig &cfg, uint64_t block_size,
                                 uint32_t codec_max_symbols,
                                 std::string &detail) {
  if (block_size == 0) {
    detail = "block size must be non-zero";
    return errc::invalid_configuration;
  }
  const uint64_t k = div_ceil(block_size, cfg.symbol_size);
  const uint64_t total = k * (1 + (uint64_t)cfg.redundancy_factor);
  if (total > codec_max_symbols) {
    detail = "block size " + std::to_string(block_size) + " needs " +
             std::to_string(total) + " symbols, limit is " +
             std::to_string(codec_max_symbols);
    return errc::invalid_configuration;
  }
  const uint64_t peak = estimate_block_peak(cfg, block_size);
  if (peak > cfg.memory_budget) {
    detail = "block size " + std::to_string(block_size) + " needs ~" +
             std::to_string(peak) + " bytes, budget is " +
             std::to_string(cfg.memory_budget);
    return errc::memory_budget_exceeded;
  }
  return {};
}

std::vector<BlockSpan> plan_blocks(uint64_t file_size, uint64_t block_size) {
  std::vector<BlockSpan> spans;
  if (file_size == 0 || block_size == 0) {
    spans.push_back(BlockSpan{0, 0, file_size});
    return spans;
  }
  uint64_t offset = 0;
  while (offset < file_size) {
    uint64_t n = std::min(block_size, file_size - offset);
    spans.push_back(BlockSpan{spans.size(), offset, n});
    offset += n;
  }
  return spans;
}

} // namespace tessera
