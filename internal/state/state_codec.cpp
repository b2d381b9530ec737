#include "state_codec.hpp"

#include <arrow/result.h>
#include <arrow/util/compression.h>
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/util/time_util.h>

#include <cmath>

#include "internal/util/errors.hpp"
#include "internal/util/sha256.hpp"

namespace jobguard::state {

namespace {

using core::v1::MapValue;
using core::v1::Value;
using util::CodecError;
using util::IntegrityError;

bool IsCanonicalDecimal(const std::string& digits) {
  size_t i = 0;
  if (i < digits.size() && digits[i] == '-') ++i;

  const size_t int_start = i;
  while (i < digits.size() && digits[i] >= '0' && digits[i] <= '9') ++i;
  if (i == int_start) return false;

  if (i == digits.size()) return true;
  if (digits[i] != '.') return false;
  ++i;

  const size_t frac_start = i;
  while (i < digits.size() && digits[i] >= '0' && digits[i] <= '9') ++i;
  return i > frac_start && i == digits.size();
}

void ValidateMap(const MapValue& map, int depth);

void ValidateValue(const Value& value, int depth) {
  if (depth > StateCodec::kMaxDepth) {
    throw CodecError("state nesting exceeds " + std::to_string(StateCodec::kMaxDepth) + " levels");
  }

  switch (value.kind_case()) {
    case Value::kNullValue:
    case Value::kBoolValue:
    case Value::kIntValue:
    case Value::kStringValue:
    case Value::kBytesValue:
      return;
    case Value::kDoubleValue:
      if (!std::isfinite(value.double_value())) {
        throw CodecError("non-finite double in state");
      }
      return;
    case Value::kTimestampValue:
      if (!google::protobuf::util::TimeUtil::IsTimestampValid(value.timestamp_value())) {
        throw CodecError("timestamp out of range");
      }
      return;
    case Value::kDecimalValue:
      if (!IsCanonicalDecimal(value.decimal_value().digits())) {
        throw CodecError("malformed decimal '" + value.decimal_value().digits() + "'");
      }
      return;
    case Value::kMapValue:
      ValidateMap(value.map_value(), depth + 1);
      return;
    case Value::kListValue:
      for (const auto& item : value.list_value().values()) {
        ValidateValue(item, depth + 1);
      }
      return;
    case Value::KIND_NOT_SET:
      throw CodecError("value without kind");
  }
}

void ValidateMap(const MapValue& map, int depth) {
  for (const auto& [key, value] : map.fields()) {
    (void)key;
    ValidateValue(value, depth);
  }
}

std::string SerializeDeterministic(const google::protobuf::MessageLite& message) {
  std::string out;
  {
    google::protobuf::io::StringOutputStream stream(&out);
    google::protobuf::io::CodedOutputStream  coded(&stream);
    coded.SetSerializationDeterministic(true);
    if (!message.SerializeToCodedStream(&coded)) {
      throw CodecError("failed to serialize state");
    }
  }
  return out;
}

arrow::Compression::type ToArrow(CompressionType compression) {
  switch (compression) {
    case core::v1::COMPRESSION_TYPE_GZIP:
      return arrow::Compression::GZIP;
    case core::v1::COMPRESSION_TYPE_ZSTD:
      return arrow::Compression::ZSTD;
    case core::v1::COMPRESSION_TYPE_NONE:
    case core::v1::COMPRESSION_TYPE_UNSPECIFIED:
    default:
      return arrow::Compression::UNCOMPRESSED;
  }
}

std::string Compress(const std::string& raw, CompressionType compression) {
  const auto type = ToArrow(compression);
  if (type == arrow::Compression::UNCOMPRESSED) {
    return raw;
  }

  auto codec_result = arrow::util::Codec::Create(type);
  if (!codec_result.ok()) {
    throw CodecError("compression codec unavailable: " + codec_result.status().ToString());
  }
  auto codec = std::move(*codec_result);

  const auto* input   = reinterpret_cast<const uint8_t*>(raw.data());
  const auto  max_len = codec->MaxCompressedLen(static_cast<int64_t>(raw.size()), input);

  std::string out(static_cast<size_t>(max_len), '\0');
  auto        written = codec->Compress(static_cast<int64_t>(raw.size()), input, max_len, reinterpret_cast<uint8_t*>(out.data()));
  if (!written.ok()) {
    throw CodecError("compression failed: " + written.status().ToString());
  }
  out.resize(static_cast<size_t>(*written));
  return out;
}

std::string Decompress(std::string_view bytes, CompressionType compression, uint64_t raw_size) {
  const auto type = ToArrow(compression);
  if (type == arrow::Compression::UNCOMPRESSED) {
    if (bytes.size() != raw_size) {
      throw IntegrityError(IntegrityError::Kind::kUndecodable, "uncompressed payload size differs from recorded raw size");
    }
    return std::string(bytes);
  }
  if (raw_size == 0) {
    return {};
  }

  auto codec_result = arrow::util::Codec::Create(type);
  if (!codec_result.ok()) {
    throw IntegrityError(IntegrityError::Kind::kUndecodable, "compression codec unavailable: " + codec_result.status().ToString());
  }
  auto codec = std::move(*codec_result);

  std::string out(raw_size, '\0');
  auto        written = codec->Decompress(static_cast<int64_t>(bytes.size()), reinterpret_cast<const uint8_t*>(bytes.data()),
                                          static_cast<int64_t>(raw_size), reinterpret_cast<uint8_t*>(out.data()));
  if (!written.ok()) {
    throw IntegrityError(IntegrityError::Kind::kUndecodable, "decompression failed: " + written.status().ToString());
  }
  if (static_cast<uint64_t>(*written) != raw_size) {
    throw IntegrityError(IntegrityError::Kind::kUndecodable, "decompressed size differs from recorded raw size");
  }
  return out;
}

template <typename Message>
EncodedState EncodeMessage(const Message& message, CompressionType compression) {
  StateCodec::Validate(message);

  if (compression == core::v1::COMPRESSION_TYPE_UNSPECIFIED) {
    compression = core::v1::COMPRESSION_TYPE_GZIP;
  }

  const auto raw = SerializeDeterministic(message);

  EncodedState encoded;
  encoded.bytes          = Compress(raw, compression);
  encoded.checksum       = StateCodec::Checksum(encoded.bytes);
  encoded.raw_size_bytes = raw.size();
  encoded.compression    = compression;
  return encoded;
}

template <typename Message>
Message DecodeMessage(std::string_view bytes, const EncodedState& stored) {
  if (StateCodec::Checksum(bytes) != stored.checksum) {
    throw IntegrityError(IntegrityError::Kind::kChecksumMismatch, "checksum mismatch");
  }

  const auto raw = Decompress(bytes, stored.compression, stored.raw_size_bytes);

  Message message;
  if (!message.ParseFromString(raw)) {
    throw IntegrityError(IntegrityError::Kind::kUndecodable, "payload does not parse");
  }

  try {
    StateCodec::Validate(message);
  } catch (const CodecError& e) {
    throw IntegrityError(IntegrityError::Kind::kUndecodable, std::string("decoded state is invalid: ") + e.what());
  }
  return message;
}

} // namespace

void StateCodec::Validate(const Value& value) {
  ValidateValue(value, 0);
}

void StateCodec::Validate(const MapValue& map) {
  ValidateMap(map, 0);
}

void StateCodec::Validate(const core::v1::Checkpoint& checkpoint) {
  ValidateMap(checkpoint.state_data(), 0);
  ValidateMap(checkpoint.execution_context(), 0);
  ValidateMap(checkpoint.variables(), 0);
  ValidateMap(checkpoint.performance_metrics(), 0);
  for (const auto& entry : checkpoint.error_log()) {
    ValidateMap(entry, 0);
  }
}

void StateCodec::Validate(const core::v1::SessionSnapshot& snapshot) {
  ValidateMap(snapshot.automation_state(), 0);
  ValidateMap(snapshot.browser_state(), 0);
  ValidateMap(snapshot.custom_data(), 0);
  for (const auto& entry : snapshot.network_logs()) {
    ValidateMap(entry, 0);
  }
  for (const auto& entry : snapshot.console_logs()) {
    ValidateMap(entry, 0);
  }
}

EncodedState StateCodec::Encode(const core::v1::Checkpoint& checkpoint, CompressionType compression) {
  return EncodeMessage(checkpoint, compression);
}

EncodedState StateCodec::Encode(const core::v1::SessionSnapshot& snapshot, CompressionType compression) {
  return EncodeMessage(snapshot, compression);
}

core::v1::Checkpoint StateCodec::DecodeCheckpoint(std::string_view bytes, const EncodedState& stored) {
  return DecodeMessage<core::v1::Checkpoint>(bytes, stored);
}

core::v1::SessionSnapshot StateCodec::DecodeSnapshot(std::string_view bytes, const EncodedState& stored) {
  return DecodeMessage<core::v1::SessionSnapshot>(bytes, stored);
}

std::string StateCodec::SerializeValue(const Value& value) {
  Validate(value);
  return SerializeDeterministic(value);
}

Value StateCodec::ParseValue(std::string_view bytes) {
  Value value;
  if (!value.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
    throw CodecError("stored value does not parse");
  }
  Validate(value);
  return value;
}

std::string StateCodec::Checksum(std::string_view bytes) {
  return util::Sha256Hex(bytes);
}

std::string_view StateCodec::CompressionName(CompressionType compression) {
  switch (compression) {
    case core::v1::COMPRESSION_TYPE_GZIP:
      return "gzip";
    case core::v1::COMPRESSION_TYPE_ZSTD:
      return "zstd";
    case core::v1::COMPRESSION_TYPE_NONE:
      return "none";
    default:
      return "unspecified";
  }
}

} // namespace jobguard::state
