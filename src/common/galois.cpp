#include "galois.hpp"
#include <vector>

namespace tessera {
namespace gf16 {

namespace {

constexpr uint32_t kPoly = 0x1100B;
constexpr uint32_t kOrder = kFieldSize - 1;

struct Tables {
  std::vector<uint16_t> log;
  std::vector<uint16_t> exp;
  Tables() : log(kFieldSize, 0), exp(2 * kOrder, 0) {
    uint32_t x = 1;
    for (uint32_t i = 0; i < kOrder; i++) {
      exp[i] = (uint16_t)x;
      log[x] = (uint16_t)i;
      x <<= 1;
      if (x & kFieldSize)
        x ^= kPoly;
    }
    for (uint32_t i = 0; i < kOrder; i++)
      exp[i + kOrder] = exp[i];
  }
};

const Tables &tables() {
  static const Tables t;
  return t;
}

} // namespace

uint16_t mul(uint16_t a, uint16_t b) {
  if (a == 0 || b == 0)
    return 0;
  const Tables &t = tables();
  return t.exp[(uint32_t)t.log[a] + t.log[b]];
}

uint16_t inv(uint16_t a) {
  if (a == 0)
    return 0;
  const Tables &t = tables();
  return t.exp[kOrder - t.log[a]];
}

uint16_t div(uint16_t a, uint16_t b) { return mul(a, inv(b)); }

void mul_add_region(uint16_t *dst, const uint16_t *src, uint16_t c, size_t n) {
  if (c == 0)
    return;
  const Tables &t = tables();
  const uint16_t *lg = t.log.data();
  const uint16_t *ex = t.exp.data();
  if (c == 1) {
    for (size_t i = 0; i < n; i++)
      dst[i] ^= src[i];
    return;
  }
  uint32_t lc = lg[c];
  for (size_t i = 0; i < n; i++) {
    uint16_t s = src[i];
    if (s)
      dst[i] ^= ex[lc + lg[s]];
  }
}

void mul_region(uint16_t *dst, uint16_t c, size_t n) {
  if (c == 1)
    return;
  if (c == 0) {
    for (size_t i = 0; i < n; i++)
      dst[i] = 0;
    return;
  }
  const Tables &t = tables();
  uint32_t lc = t.log[c];
  for (size_t i = 0; i < n; i++) {
    uint16_t s = dst[i];
    if (s)
      dst[i] = t.exp[lc + t.log[s]];
  }
}

} // namespace gf16
} // namespace tessera
