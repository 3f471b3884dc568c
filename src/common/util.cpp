#include "util.hpp"
#include <cctype>
#include <limits>
#include <stdexcept>

namespace tessera {

bool parse_size(const std::string &s, uint64_t &out) {
  if (s.empty())
    return false;
  size_t digits = 0;
  while (digits < s.size() && std::isdigit((unsigned char)s[digits]))
    digits++;
  if (digits == 0)
    return false;
  uint64_t mult = 1;
  std::string suffix = s.substr(digits);
  if (suffix == "" || suffix == "B" || suffix == "b")
    mult = 1;
  else if (suffix == "K" || suffix == "k" || suffix == "KiB")
    mult = 1024ull;
  else if (suffix == "M" || suffix == "m" || suffix == "MiB")
    mult = 1024ull * 1024;
  else if (suffix == "G" || suffix == "g" || suffix == "GiB")
    mult = 1024ull * 1024 * 1024;
  else
    return false;
  try {
    unsigned long long v = std::stoull(s.substr(0, digits));
    if (v > std::numeric_limits<uint64_t>::max() / mult)
      return false;
    out = (uint64_t)v * mult;
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

std::string bytes_to_hex(const uint8_t *data, size_t len) {
  static const char digits[] = "0123456789abcdef";
  std::string out(len * 2, '0');
  for (size_t i = 0; i < len; i++) {
    out[2 * i] = digits[data[i] >> 4];
    out[2 * i + 1] = digits[data[i] & 0x0F];
  }
  return out;
}

} // namespace tessera
