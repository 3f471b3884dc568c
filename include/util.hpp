#pragma once
#include <string>
#include <cstddef>
#include <cstdint>

namespace tessera {

// Accepts a plain byte count or one with a K/M/G suffix (binary multiples).
bool parse_size(const std::string& s, uint64_t& out);
std::string bytes_to_hex(const uint8_t* data, size_t len);

inline uint64_t div_ceil(uint64_t a, uint64_t b) { return b ? (a + b - 1) / b : 0; }

} // namespace tessera
