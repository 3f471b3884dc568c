#pragma once
#include <cstdint>
#include <string>
#include <system_error>
#include <vector>
#include "codec.hpp"
#include "config.hpp"

namespace tessera {

// Cap on source symbols per recommended block; keeps per-block matrix and
// symbol bookkeeping small relative to payload throughput. The codec's own
// preferred_max_source_symbols() may lower it further.
constexpr uint32_t kMaxSourceSymbolsPerBlock = 1024;

struct BlockSpan {
    uint64_t block_id{0};
    uint64_t offset{0};
    uint64_t size{0};
};

uint64_t padded_symbol_width(const SessionConfig& cfg);

// Estimated resident bytes while one block of `block_size` is in flight:
// the block buffer plus every source and repair symbol.
uint64_t estimate_block_peak(const SessionConfig& cfg, uint64_t block_size);

uint64_t recommend_block_size(const SessionConfig& cfg, uint64_t file_size,
                              const SymbolCodec& codec);

// Rejects block sizes the codec cannot represent or the budget cannot hold.
std::error_code check_block_size(const SessionConfig& cfg, uint64_t block_size,
                                 uint32_t codec_max_symbols, std::string& detail);

// Contiguous, gap-free partition of [0, file_size). A 0-byte file yields one
// empty block.
std::vector<BlockSpan> plan_blocks(uint64_t file_size, uint64_t block_size);

} // namespace tessera
