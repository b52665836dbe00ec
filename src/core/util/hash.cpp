#include "core/util/hash.hpp"

#include <array>
#include <mutex>

#include <sodium.h>

#include "core/util/canonical.hpp"

namespace gambit::util {

bool ensure_sodium() {
  static std::once_flag once;
  static bool ready = false;
  std::call_once(once, [] { ready = sodium_init() >= 0; });
  return ready;
}

std::string sha256_bytes(std::string_view payload) {
  ensure_sodium();
  std::array<unsigned char, crypto_hash_sha256_BYTES> digest{};
  crypto_hash_sha256(digest.data(), reinterpret_cast<const unsigned char*>(payload.data()),
                     static_cast<unsigned long long>(payload.size()));
  return std::string{reinterpret_cast<const char*>(digest.data()), digest.size()};
}

std::string sha256_hex(std::string_view payload) {
  return to_hex(sha256_bytes(payload));
}

}  // namespace gambit::util
