#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace jobguard::util {

/*
  UUID helpers (RFC4122 version 4).
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// "<prefix><16 lowercase hex>", e.g. "chk_3f9a0c1e5b7d2468".
std::string PrefixedId(std::string_view prefix);

} // namespace jobguard::util
