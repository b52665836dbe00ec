#pragma once

#include <string>
#include <string_view>

namespace gambit::util {

// Initialises libsodium once per process. Safe to call from any thread.
bool ensure_sodium();

std::string sha256_bytes(std::string_view payload);
std::string sha256_hex(std::string_view payload);

}  // namespace gambit::util
