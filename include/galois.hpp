#pragma once
#include <cstddef>
#include <cstdint>

namespace tessera {
namespace gf16 {

// GF(2^16) over x^16 + x^12 + x^3 + x + 1. Addition is XOR.
constexpr uint32_t kFieldSize = 65536;

uint16_t mul(uint16_t a, uint16_t b);
uint16_t inv(uint16_t a);
uint16_t div(uint16_t a, uint16_t b);

// dst[i] ^= c * src[i]
void mul_add_region(uint16_t* dst, const uint16_t* src, uint16_t c, size_t n);
// dst[i] = c * dst[i]
void mul_region(uint16_t* dst, uint16_t c, size_t n);

} // namespace gf16
} // namespace tessera
