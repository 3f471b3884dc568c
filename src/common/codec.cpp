#include "codec.hpp"
#include "errors.hpp"
#include "galois.hpp"
#include <algorithm>
#include <cstring>
#include <map>

namespace tessera {

namespace {

struct Oti {
  uint64_t transfer_length{0};
  uint16_t symbol_size{0};
  uint32_t repair_symbols{0};
};

std::vector<uint8_t> pack_oti(const Oti &o) {
  std::vector<uint8_t> p(kEncoderParametersBytes, 0);
  for (int i = 0; i < 6; i++)
    p[i] = (uint8_t)(o.transfer_length >> (8 * (5 - i)));
  p[6] = (uint8_t)(o.symbol_size >> 8);
  p[7] = (uint8_t)(o.symbol_size & 0xFF);
  for (int i = 0; i < 4; i++)
    p[8 + i] = (uint8_t)(o.repair_symbols >> (8 * (3 - i)));
  return p;
}

bool unpack_oti(const std::vector<uint8_t> &p, Oti &o) {
  if (p.size() != kEncoderParametersBytes)
    return false;
  o.transfer_length = 0;
  for (int i = 0; i < 6; i++)
    o.transfer_length = (o.transfer_length << 8) | p[i];
  o.symbol_size = (uint16_t)((p[6] << 8) | p[7]);
  o.repair_symbols = 0;
  for (int i = 0; i < 4; i++)
    o.repair_symbols = (o.repair_symbols << 8) | p[8 + i];
  if (o.symbol_size == 0)
    return false;
  // K and K + R must fit the field; this also bounds transfer_length.
  const uint64_t k = (o.transfer_length + o.symbol_size - 1) / o.symbol_size;
  return k + o.repair_symbols <= gf16::kFieldSize;
}

uint32_t source_count(uint64_t len, uint16_t symbol_size) {
  return (uint32_t)((len + symbol_size - 1) / symbol_size);
}

// Odd symbol sizes are padded by one byte so payloads map onto 16-bit words.
size_t padded_width(uint16_t symbol_size) {
  return (size_t)symbol_size + (symbol_size & 1);
}

void load_words(const uint8_t *src, size_t n, uint16_t *words) {
  for (size_t i = 0; i < n; i += 2) {
    uint16_t lo = src[i];
    uint16_t hi = (i + 1 < n) ? src[i + 1] : 0;
    words[i / 2] = (uint16_t)(lo | (hi << 8));
  }
}

void store_words(const uint16_t *words, size_t n, uint8_t *dst) {
  for (size_t i = 0; i < n; i++) {
    uint16_t w = words[i / 2];
    dst[i] = (i & 1) ? (uint8_t)(w >> 8) : (uint8_t)(w & 0xFF);
  }
}

std::vector<uint8_t> make_packet(uint32_t esi, const uint8_t *payload,
                                 size_t n) {
  std::vector<uint8_t> pkt(kPacketHeaderBytes + n);
  pkt[0] = (uint8_t)(esi >> 24);
  pkt[1] = (uint8_t)(esi >> 16);
  pkt[2] = (uint8_t)(esi >> 8);
  pkt[3] = (uint8_t)(esi & 0xFF);
  if (n)
    std::memcpy(pkt.data() + kPacketHeaderBytes, payload, n);
  return pkt;
}

// Cauchy element for repair row `esi` (>= K) and source column `col` (< K).
uint16_t cauchy(uint32_t esi, uint32_t col) {
  return gf16::inv((uint16_t)(esi ^ col));
}

} // namespace

uint32_t packet_esi(const std::vector<uint8_t> &packet) {
  if (packet.size() < kPacketHeaderBytes)
    return 0;
  return ((uint32_t)packet[0] << 24) | ((uint32_t)packet[1] << 16) |
         ((uint32_t)packet[2] << 8) | (uint32_t)packet[3];
}

uint32_t CauchyCodec::max_symbols() const { return gf16::kFieldSize; }

uint32_t CauchyCodec::required_symbols(
    const std::vector<uint8_t> &parameters) const {
  Oti o;
  if (!unpack_oti(parameters, o))
    return 0;
  return source_count(o.transfer_length, o.symbol_size);
}

std::optional<uint64_t> CauchyCodec::transfer_length(
    const std::vector<uint8_t> &parameters) const {
  Oti o;
  if (!unpack_oti(parameters, o))
    return std::nullopt;
  return o.transfer_length;
}

std::error_code CauchyCodec::encode(const uint8_t *data, size_t len,
                                    uint16_t symbol_size,
                                    uint8_t redundancy_factor,
                                    EncodedBlock &out,
                                    std::string &detail) const {
  out = EncodedBlock{};
  if (symbol_size == 0) {
    detail = "symbol size must be non-zero";
    return errc::encoding_failure;
  }
  if ((uint64_t)len > kMaxTransferLength) {
    detail = "block of " + std::to_string(len) + " bytes exceeds transfer limit";
    return errc::encoding_failure;
  }
  const uint32_t k = source_count(len, symbol_size);
  const uint64_t r = (uint64_t)k * redundancy_factor;
  if ((uint64_t)k + r > max_symbols()) {
    detail = "block needs " + std::to_string((uint64_t)k + r) +
             " symbols, codec limit is " + std::to_string(max_symbols());
    return errc::encoding_failure;
  }

  Oti o;
  o.transfer_length = len;
  o.symbol_size = symbol_size;
  o.repair_symbols = (uint32_t)r;
  out.parameters = pack_oti(o);
  out.source_symbols = k;
  out.repair_symbols = (uint32_t)r;
  out.symbols.reserve(k + r);

  const size_t width = padded_width(symbol_size);
  const size_t nwords = width / 2;
  std::vector<uint16_t> source((size_t)k * nwords, 0);
  for (uint32_t j = 0; j < k; j++) {
    size_t off = (size_t)j * symbol_size;
    size_t n = std::min<size_t>(symbol_size, len - off);
    load_words(data + off, n, source.data() + (size_t)j * nwords);
    out.symbols.push_back(make_packet(j, data + off, n));
  }

  std::vector<uint16_t> row(nwords);
  std::vector<uint8_t> bytes(width);
  for (uint32_t i = 0; i < r; i++) {
    const uint32_t esi = k + i;
    std::fill(row.begin(), row.end(), 0);
    for (uint32_t j = 0; j < k; j++)
      gf16::mul_add_region(row.data(), source.data() + (size_t)j * nwords,
                           cauchy(esi, j), nwords);
    store_words(row.data(), width, bytes.data());
    out.symbols.push_back(make_packet(esi, bytes.data(), width));
  }
  return {};
}

std::error_code CauchyCodec::decode(
    const std::vector<uint8_t> &parameters,
    const std::vector<std::vector<uint8_t>> &symbols, std::vector<uint8_t> &out,
    std::string &detail) const {
  out.clear();
  Oti o;
  if (!unpack_oti(parameters, o)) {
    detail = "malformed encoder parameters";
    return errc::decoding_failure;
  }
  const uint32_t k = source_count(o.transfer_length, o.symbol_size);
  if (k == 0)
    return {};

  const size_t width = padded_width(o.symbol_size);
  const size_t nwords = width / 2;
  const uint32_t last = k - 1;
  const size_t last_len =
      (size_t)(o.transfer_length - (uint64_t)last * o.symbol_size);

  // Keyed by esi; duplicates and malformed packets are ignored.
  std::map<uint32_t, const std::vector<uint8_t> *> sources, repairs;
  for (const auto &pkt : symbols) {
    if (pkt.size() < kPacketHeaderBytes)
      continue;
    uint32_t esi = packet_esi(pkt);
    size_t n = pkt.size() - kPacketHeaderBytes;
    if (esi < k) {
      size_t expect = esi == last ? last_len : o.symbol_size;
      if (n == expect)
        sources.emplace(esi, &pkt);
    } else if (esi < (uint64_t)k + o.repair_symbols) {
      if (n == width)
        repairs.emplace(esi, &pkt);
    }
  }

  const size_t have = sources.size() + repairs.size();
  if (have < k) {
    detail = "have " + std::to_string(have) + " usable symbols, need " +
             std::to_string(k);
    return errc::insufficient_symbols;
  }

  std::vector<uint16_t> source((size_t)k * nwords, 0);
  std::vector<uint32_t> missing;
  for (uint32_t j = 0; j < k; j++) {
    auto it = sources.find(j);
    if (it == sources.end()) {
      missing.push_back(j);
      continue;
    }
    const auto &pkt = *it->second;
    load_words(pkt.data() + kPacketHeaderBytes, pkt.size() - kPacketHeaderBytes,
               source.data() + (size_t)j * nwords);
  }

  if (!missing.empty()) {
    const size_t m = missing.size();
    std::vector<uint32_t> rows;
    for (const auto &kv : repairs) {
      if (rows.size() == m)
        break;
      rows.push_back(kv.first);
    }

    // rhs[a] = repair[a] minus the contribution of every known source.
    std::vector<uint16_t> rhs(m * nwords, 0);
    std::vector<uint16_t> a(m * m, 0);
    for (size_t ri = 0; ri < m; ri++) {
      const auto &pkt = *repairs[rows[ri]];
      uint16_t *dst = rhs.data() + ri * nwords;
      load_words(pkt.data() + kPacketHeaderBytes, width, dst);
      for (uint32_t j = 0; j < k; j++) {
        if (sources.count(j))
          gf16::mul_add_region(dst, source.data() + (size_t)j * nwords,
                               cauchy(rows[ri], j), nwords);
      }
      for (size_t c = 0; c < m; c++)
        a[ri * m + c] = cauchy(rows[ri], missing[c]);
    }

    // Gauss-Jordan on the m x m Cauchy submatrix, mirrored onto rhs.
    for (size_t col = 0; col < m; col++) {
      size_t pivot = col;
      while (pivot < m && a[pivot * m + col] == 0)
        pivot++;
      if (pivot == m) {
        detail = "singular recovery matrix";
        return errc::decoding_failure;
      }
      if (pivot != col) {
        std::swap_ranges(a.begin() + pivot * m, a.begin() + pivot * m + m,
                         a.begin() + col * m);
        std::swap_ranges(rhs.begin() + pivot * nwords,
                         rhs.begin() + pivot * nwords + nwords,
                         rhs.begin() + col * nwords);
      }
      uint16_t scale = gf16::inv(a[col * m + col]);
      gf16::mul_region(a.data() + col * m, scale, m);
      gf16::mul_region(rhs.data() + col * nwords, scale, nwords);
      for (size_t r = 0; r < m; r++) {
        uint16_t f = a[r * m + col];
        if (r == col || f == 0)
          continue;
        gf16::mul_add_region(a.data() + r * m, a.data() + col * m, f, m);
        gf16::mul_add_region(rhs.data() + r * nwords, rhs.data() + col * nwords,
                             f, nwords);
      }
    }

    for (size_t c = 0; c < m; c++)
      std::copy(rhs.begin() + c * nwords, rhs.begin() + (c + 1) * nwords,
                source.begin() + (size_t)missing[c] * nwords);
  }

  out.resize((size_t)o.transfer_length);
  for (uint32_t j = 0; j < k; j++) {
    size_t off = (size_t)j * o.symbol_size;
    size_t n = j == last ? last_len : o.symbol_size;
    store_words(source.data() + (size_t)j * nwords, n, out.data() + off);
  }
  return {};
}

} // namespace tessera
