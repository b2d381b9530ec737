#include "internal/claim/idempotency_key.hpp"

#include "internal/state/canonical_json.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/sha256.hpp"

namespace jobguard::claim {

std::string IdempotencyKey::ToString() const {
  return std::to_string(ticket_id) + ":" + operation_type + ":" + config_hash + ":" + std::to_string(retry_count);
}

IdempotencyKey ComputeIdempotencyKey(int64_t ticket_id, std::string_view operation_type, const core::v1::MapValue& config, uint32_t retry_count) {
  if (operation_type.empty()) {
    throw util::InvalidArgument("operation type must not be empty");
  }
  if (operation_type.find(':') != std::string_view::npos) {
    throw util::InvalidArgument("operation type must not contain ':'");
  }

  IdempotencyKey key;
  key.ticket_id      = ticket_id;
  key.operation_type = std::string(operation_type);
  key.config_hash    = util::Sha256Hex(state::CanonicalJson(config)).substr(0, kConfigHashLength);
  key.retry_count    = retry_count;
  return key;
}

} // namespace jobguard::claim
