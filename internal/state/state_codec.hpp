#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "jobguard/core/v1/checkpoint.pb.h"
#include "jobguard/core/v1/value.pb.h"

namespace jobguard::state {

using core::v1::CompressionType;

/*
  Stored form of one encoded state object.

  `checksum` is the hex SHA-256 of `bytes`, i.e. of the compressed
  stream, and must be verified before anything is decompressed.
*/
struct EncodedState {
  std::string     bytes;
  std::string     checksum;
  uint64_t        raw_size_bytes = 0;
  CompressionType compression    = core::v1::COMPRESSION_TYPE_NONE;
};

/*
  StateCodec

  Encodes structured automation state into a deterministic,
  compressed, checksummed byte stream and back.

  Encode rejects invalid values with util::CodecError. Decode reports
  every failure (checksum, decompression, parse, validation) as
  util::IntegrityError; partially decoded data is never returned.
*/
class StateCodec {
 public:
  static constexpr int kMaxDepth = 64;

  static void Validate(const core::v1::Value& value);
  static void Validate(const core::v1::MapValue& map);
  static void Validate(const core::v1::Checkpoint& checkpoint);
  static void Validate(const core::v1::SessionSnapshot& snapshot);

  static EncodedState Encode(const core::v1::Checkpoint& checkpoint, CompressionType compression);
  static EncodedState Encode(const core::v1::SessionSnapshot& snapshot, CompressionType compression);

  static core::v1::Checkpoint      DecodeCheckpoint(std::string_view bytes, const EncodedState& stored);
  static core::v1::SessionSnapshot DecodeSnapshot(std::string_view bytes, const EncodedState& stored);

  // Uncompressed deterministic form, used for job results.
  static std::string     SerializeValue(const core::v1::Value& value);
  static core::v1::Value ParseValue(std::string_view bytes);

  static std::string Checksum(std::string_view bytes);

  static std::string_view CompressionName(CompressionType compression);
};

} // namespace jobguard::state
