#pragma once
#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace tessera {

// Serialized symbol: [esi:u32 BE][payload]
constexpr size_t kPacketHeaderBytes = 4;
constexpr size_t kEncoderParametersBytes = 12;
constexpr uint64_t kMaxTransferLength = (1ull << 48) - 1;

struct EncodedBlock {
    std::vector<uint8_t> parameters;
    std::vector<std::vector<uint8_t>> symbols; // source symbols first, then repair
    uint32_t source_symbols{0};
    uint32_t repair_symbols{0};
};

class SymbolCodec {
public:
    virtual ~SymbolCodec() = default;
    virtual std::error_code encode(const uint8_t* data, size_t len, uint16_t symbol_size,
                                   uint8_t redundancy_factor, EncodedBlock& out,
                                   std::string& detail) const = 0;
    virtual std::error_code decode(const std::vector<uint8_t>& parameters,
                                   const std::vector<std::vector<uint8_t>>& symbols,
                                   std::vector<uint8_t>& out, std::string& detail) const = 0;
    // Minimum number of distinct symbols decode() needs for these parameters.
    virtual uint32_t required_symbols(const std::vector<uint8_t>& parameters) const = 0;
    // Block length the parameters describe; nullopt if they are malformed.
    virtual std::optional<uint64_t> transfer_length(const std::vector<uint8_t>& parameters) const = 0;
    // Upper bound on source + repair symbols for one block.
    virtual uint32_t max_symbols() const = 0;
    // Source symbols per block beyond which encode cost dominates throughput.
    virtual uint32_t preferred_max_source_symbols() const = 0;
};

// Systematic MDS code over GF(2^16): K source symbols plus K * redundancy
// repair symbols built from a Cauchy matrix. Any K distinct symbols decode.
class CauchyCodec : public SymbolCodec {
public:
    std::error_code encode(const uint8_t* data, size_t len, uint16_t symbol_size,
                           uint8_t redundancy_factor, EncodedBlock& out,
                           std::string& detail) const override;
    std::error_code decode(const std::vector<uint8_t>& parameters,
                           const std::vector<std::vector<uint8_t>>& symbols,
                           std::vector<uint8_t>& out, std::string& detail) const override;
    uint32_t required_symbols(const std::vector<uint8_t>& parameters) const override;
    std::optional<uint64_t> transfer_length(const std::vector<uint8_t>& parameters) const override;
    uint32_t max_symbols() const override;
    // Every repair row touches all K sources, so cost per byte grows with K * r.
    uint32_t preferred_max_source_symbols() const override { return 64; }
};

uint32_t packet_esi(const std::vector<uint8_t>& packet);

} // namespace tessera
