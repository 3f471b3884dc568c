#include "digest.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <mutex>
#include <sodium.h>

namespace tessera {

static_assert(kDigestBytes == crypto_generichash_BYTES,
              "digest width must match crypto_generichash_BYTES");

bool digest_init() {
  static std::once_flag once;
  static bool ok = false;
  std::call_once(once, [] {
    ok = sodium_init() >= 0;
    if (!ok)
      Logger::instance().log(LogLevel::ERROR, "sodium_init failed");
  });
  return ok;
}

std::string content_digest(const uint8_t *data, size_t len) {
  uint8_t out[kDigestBytes];
  static const uint8_t empty = 0;
  crypto_generichash(out, sizeof(out), len ? data : &empty,
                     (unsigned long long)len, nullptr, 0);
  return bytes_to_hex(out, sizeof(out));
}

bool is_digest_string(const std::string &s) {
  if (s.size() != kDigestBytes * 2)
    return false;
  for (char c : s) {
    bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    if (!hex)
      return false;
  }
  return true;
}

} // namespace tessera
