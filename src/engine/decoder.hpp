#pragma once
#include <cstdint>
#include <string>
#include <system_error>
#include <vector>
#include "codec.hpp"
#include "config.hpp"
#include "layout.hpp"
#include "resource_gate.hpp"
#include "symbol_store.hpp"

namespace tessera {

// Rebuilds a file from a layout and the symbol files it references.
// Blocks are decoded in parallel, verified against their recorded hash and
// written at their recorded offsets into a staging file that is promoted to
// `output_path` only when every block succeeded.
class DecoderOrchestrator {
public:
    DecoderOrchestrator(const SymbolCodec& codec, ResourceGate& gate, const SessionConfig& cfg)
        : codec_(codec), gate_(gate), cfg_(cfg) {}

    std::error_code decode(const SymbolStore& symbols, const std::string& output_path,
                           const std::vector<BlockRecord>& layout, std::string& detail) const;

    // `detail` does not name the block; decode() prefixes it.
    std::error_code decode_block(const SymbolStore& symbols, const BlockRecord& rec,
                                 std::vector<uint8_t>& out, std::string& detail) const;

private:
    const SymbolCodec& codec_;
    ResourceGate& gate_;
    const SessionConfig& cfg_;
};

// Buffer, gathered symbols and codec workspace.
uint64_t estimate_decode_peak(const BlockRecord& rec);

} // namespace tessera
