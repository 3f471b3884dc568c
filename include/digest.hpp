#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tessera {

constexpr size_t kDigestBytes = 32;

// Initializes libsodium once per process; false if the library is unusable.
// Must succeed before content_digest() is used.
bool digest_init();

// Lowercase hex BLAKE2b-256 of the input. Used both as a symbol's
// content identifier and as a block's integrity hash.
std::string content_digest(const uint8_t* data, size_t len);
inline std::string content_digest(const std::vector<uint8_t>& v) {
    return content_digest(v.data(), v.size());
}

bool is_digest_string(const std::string& s);

} // namespace tessera
