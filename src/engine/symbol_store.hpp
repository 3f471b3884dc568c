#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace tessera {

// Content-addressed symbol files in one directory; the file name is the
// symbol's digest.
class SymbolStore {
public:
    explicit SymbolStore(std::string dir) : dir_(std::move(dir)) {}

    std::error_code prepare(std::string& detail) const;
    // Rewrites an existing file under `id` unless its content verifies.
    std::error_code put(const std::string& id, const std::vector<uint8_t>& bytes,
                        std::string& detail) const;
    // nullopt when the file is absent, unreadable or no longer matches `id`.
    std::optional<std::vector<uint8_t>> get(const std::string& id) const;
    bool valid_id(const std::string& id) const;
    std::string path_for(const std::string& id) const;
    const std::string& dir() const { return dir_; }

private:
    std::string dir_;
};

} // namespace tessera
