#pragma once

#include <string>
#include <string_view>

namespace jobguard::util {

// Lowercase hex SHA-256 digest of `data`. Throws on OpenSSL failure.
std::string Sha256Hex(std::string_view data);

} // namespace jobguard::util
