#include "internal/claim/idempotency_key.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

#include "internal/state/value_builder.hpp"

namespace {

using jobguard::claim::ComputeIdempotencyKey;
using jobguard::claim::kConfigHashLength;

namespace st = jobguard::state;

void TestMapOrderingDoesNotChangeTheKey() {
  const auto a = ComputeIdempotencyKey(1, "automation", st::MapOf({{"a", st::MakeInt(1)}, {"b", st::MakeInt(2)}}));
  const auto b = ComputeIdempotencyKey(1, "automation", st::MapOf({{"b", st::MakeInt(2)}, {"a", st::MakeInt(1)}}));

  assert(a == b);
  assert(a.ToString() == b.ToString());
}

void TestKeyLayout() {
  const auto key = ComputeIdempotencyKey(42, "invoice_portal", st::MapOf({{"url", st::MakeString("https://x")}}));

  assert(key.config_hash.size() == kConfigHashLength);
  assert(key.ToString() == "42:invoice_portal:" + key.config_hash + ":0");
}

void TestEveryComponentChangesTheKey() {
  const auto config = st::MapOf({{"url", st::MakeString("https://x")}});
  const auto base   = ComputeIdempotencyKey(42, "invoice_portal", config);

  assert(ComputeIdempotencyKey(43, "invoice_portal", config).ToString() != base.ToString());
  assert(ComputeIdempotencyKey(42, "other_portal", config).ToString() != base.ToString());
  assert(ComputeIdempotencyKey(42, "invoice_portal", st::MapOf({{"url", st::MakeString("https://y")}})).ToString() != base.ToString());
  assert(ComputeIdempotencyKey(42, "invoice_portal", config, 1).ToString() != base.ToString());
}

void TestNestedConfigIsCanonicalized() {
  const auto a = ComputeIdempotencyKey(
      7, "sync", st::MapOf({{"filters", st::MakeMap({{"from", st::MakeDecimal("1.0")}, {"to", st::MakeDecimal("2.0")}})}, {"dry_run", st::MakeBool(true)}}));
  const auto b = ComputeIdempotencyKey(
      7, "sync", st::MapOf({{"dry_run", st::MakeBool(true)}, {"filters", st::MakeMap({{"to", st::MakeDecimal("2.0")}, {"from", st::MakeDecimal("1.0")}})}}));
  assert(a == b);
}

void TestInvalidOperationTypesAreRejected() {
  for (const char* op : {"", "a:b"}) {
    bool threw = false;
    try {
      (void)ComputeIdempotencyKey(1, op, {});
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  }
}

} // namespace

int main() {
  TestMapOrderingDoesNotChangeTheKey();
  TestKeyLayout();
  TestEveryComponentChangesTheKey();
  TestNestedConfigIsCanonicalized();
  TestInvalidOperationTypesAreRejected();

  std::cout << "jobguard_unit_idempotency_key: pass\n";
  return 0;
}
