#pragma once
#include <cstdint>
#include <string>
#include <system_error>
#include <vector>

namespace tessera {

std::error_code input_file_size(const std::string& path, uint64_t& size, std::string& detail);
std::error_code read_range(const std::string& path, uint64_t offset, uint64_t size,
                           std::vector<uint8_t>& out, std::string& detail);

// Output assembled at a staging path and renamed onto the final path only by
// commit(). Destroying an uncommitted StagedOutput removes the staging file.
class StagedOutput {
public:
    explicit StagedOutput(std::string final_path);
    ~StagedOutput();
    StagedOutput(const StagedOutput&) = delete;
    StagedOutput& operator=(const StagedOutput&) = delete;

    std::error_code open(uint64_t total_size, std::string& detail);
    // Safe to call concurrently for disjoint ranges.
    std::error_code write_at(uint64_t offset, const std::vector<uint8_t>& data,
                             std::string& detail) const;
    std::error_code commit(std::string& detail);
    void discard();
    const std::string& staging_path() const { return staging_; }

private:
    std::string final_;
    std::string staging_;
    bool opened_{false};
    bool committed_{false};
};

} // namespace tessera
