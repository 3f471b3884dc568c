#pragma once
#include <cstdint>
#include <string>
#include <system_error>
#include <vector>
#include "codec.hpp"
#include "config.hpp"
#include "layout.hpp"
#include "symbol_store.hpp"

namespace tessera {

class BlockProcessor {
public:
    // `store` may be null: the record is computed but no symbol is written.
    BlockProcessor(const SymbolCodec& codec, const SessionConfig& cfg, const SymbolStore* store)
        : codec_(codec), cfg_(cfg), store_(store) {}

    std::error_code process(const std::vector<uint8_t>& bytes, uint64_t block_id,
                            uint64_t offset, BlockRecord& out, std::string& detail) const;

private:
    const SymbolCodec& codec_;
    const SessionConfig& cfg_;
    const SymbolStore* store_;
};

} // namespace tessera
