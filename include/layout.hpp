#pragma once
#include <cstdint>
#include <string>
#include <system_error>
#include <vector>

namespace tessera {

constexpr const char* kLayoutFileName = "_layout.json";

struct BlockRecord {
    uint64_t block_id{0};
    std::vector<uint8_t> encoder_parameters; // opaque, passed back to the codec verbatim
    uint64_t original_offset{0};
    uint64_t size{0};
    std::vector<std::string> symbols;        // content identifiers, ESI order
    uint32_t source_symbols_count{0};
    std::string hash;

    bool operator==(const BlockRecord& o) const;
    bool operator!=(const BlockRecord& o) const { return !(*this == o); }
};

struct ProcessResult {
    uint32_t total_symbols_count{0};
    uint32_t total_repair_symbols{0};
    std::string symbols_directory;
    std::vector<BlockRecord> blocks;
    std::string layout_file_path;
};

std::string layout_to_json(const std::vector<BlockRecord>& blocks);
std::error_code layout_from_json(const std::string& text, std::vector<BlockRecord>& blocks,
                                 std::string& detail);

// Publishes atomically: the document is written beside `path` and renamed.
std::error_code write_layout(const std::string& path, const std::vector<BlockRecord>& blocks,
                             std::string& detail);
std::error_code read_layout(const std::string& path, std::vector<BlockRecord>& blocks,
                            std::string& detail);

std::string result_to_json(const ProcessResult& result);

} // namespace tessera
