#pragma once

#include <string>

#include "jobguard/core/v1/value.pb.h"

namespace jobguard::state {

/*
  Canonical JSON rendering used for hashing.

  Keys are sorted recursively by code point, separators are ", " and
  ": ", and every non-ASCII character is escaped, so two values with the
  same content always render to the same bytes regardless of insertion
  order. Typed values render as single-key tagged objects:

    timestamp -> {"__datetime__": "2024-01-02T03:04:05Z"}
    decimal   -> {"__decimal__": "12.50"}
    bytes     -> {"__bytes__": "<base64>"}

  Throws util::CodecError on values that fail StateCodec validation.
*/
std::string CanonicalJson(const core::v1::Value& value);
std::string CanonicalJson(const core::v1::MapValue& map);

} // namespace jobguard::state
