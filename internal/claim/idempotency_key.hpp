#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "jobguard/core/v1/value.pb.h"

namespace jobguard::claim {

/*
  Deterministic identity of one logical request.

  config_hash is the first 16 hex characters of the SHA-256 of the
  canonical JSON of the operation config, so map ordering never changes
  the key.
*/
struct IdempotencyKey {
  int64_t     ticket_id = 0;
  std::string operation_type;
  std::string config_hash;
  uint32_t    retry_count = 0;

  // "<ticket_id>:<operation_type>:<config_hash>:<retry_count>"
  std::string ToString() const;

  bool operator==(const IdempotencyKey&) const = default;
};

inline constexpr std::size_t kConfigHashLength = 16;

// Throws util::InvalidArgument for an empty or ':'-containing operation type.
IdempotencyKey ComputeIdempotencyKey(int64_t ticket_id, std::string_view operation_type, const core::v1::MapValue& config, uint32_t retry_count = 0);

} // namespace jobguard::claim
