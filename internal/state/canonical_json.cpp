#include "canonical_json.hpp"

#include <google/protobuf/util/time_util.h>
#include <openssl/evp.h>

#include <algorithm>
#include <charconv>
#include <vector>

#include "internal/state/state_codec.hpp"
#include "internal/util/errors.hpp"

namespace jobguard::state {

namespace {

using core::v1::MapValue;
using core::v1::Value;

void AppendEscapedUnit(std::string& out, uint32_t unit) {
  static constexpr char kHex[] = "0123456789abcdef";
  out += "\\u";
  out.push_back(kHex[(unit >> 12) & 0xF]);
  out.push_back(kHex[(unit >> 8) & 0xF]);
  out.push_back(kHex[(unit >> 4) & 0xF]);
  out.push_back(kHex[unit & 0xF]);
}

// Decodes one UTF-8 sequence starting at `i`, advancing `i` past it.
uint32_t NextCodePoint(const std::string& s, size_t& i) {
  const auto lead = static_cast<unsigned char>(s[i]);
  int        extra;
  uint32_t   cp;
  if (lead < 0x80) {
    ++i;
    return lead;
  } else if ((lead & 0xE0) == 0xC0) {
    extra = 1;
    cp    = lead & 0x1F;
  } else if ((lead & 0xF0) == 0xE0) {
    extra = 2;
    cp    = lead & 0x0F;
  } else if ((lead & 0xF8) == 0xF0) {
    extra = 3;
    cp    = lead & 0x07;
  } else {
    throw util::CodecError("invalid UTF-8 lead byte in string");
  }

  if (i + extra >= s.size()) {
    throw util::CodecError("truncated UTF-8 sequence in string");
  }
  for (int k = 1; k <= extra; ++k) {
    const auto cont = static_cast<unsigned char>(s[i + k]);
    if ((cont & 0xC0) != 0x80) {
      throw util::CodecError("invalid UTF-8 continuation byte in string");
    }
    cp = (cp << 6) | (cont & 0x3F);
  }
  static constexpr uint32_t kMinForLength[] = {0, 0x80, 0x800, 0x10000};
  if (cp < kMinForLength[extra]) {
    throw util::CodecError("overlong UTF-8 sequence in string");
  }
  if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
    throw util::CodecError("UTF-8 sequence encodes an invalid code point");
  }
  i += extra + 1;
  return cp;
}

void AppendString(std::string& out, const std::string& s) {
  out.push_back('"');
  size_t i = 0;
  while (i < s.size()) {
    const uint32_t cp = NextCodePoint(s, i);
    switch (cp) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      case '\b':
        out += "\\b";
        break;
      case '\f':
        out += "\\f";
        break;
      default:
        if (cp < 0x20 || cp > 0x7E) {
          if (cp > 0xFFFF) {
            const uint32_t v = cp - 0x10000;
            AppendEscapedUnit(out, 0xD800 + (v >> 10));
            AppendEscapedUnit(out, 0xDC00 + (v & 0x3FF));
          } else {
            AppendEscapedUnit(out, cp);
          }
        } else {
          out.push_back(static_cast<char>(cp));
        }
    }
  }
  out.push_back('"');
}

// Shortest round-trip form; integral values keep a trailing ".0".
void AppendDouble(std::string& out, double d) {
  char buffer[64];
  auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), d);
  if (ec != std::errc{}) {
    throw util::CodecError("cannot render double");
  }
  std::string text(buffer, end);
  if (text.find_first_of(".en") == std::string::npos) {
    text += ".0";
  }
  out += text;
}

std::string Base64(const std::string& bytes) {
  if (bytes.empty()) return {};
  std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
  const int   n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), reinterpret_cast<const unsigned char*>(bytes.data()),
                                  static_cast<int>(bytes.size()));
  out.resize(static_cast<size_t>(n));
  return out;
}

void AppendTagged(std::string& out, const char* tag, const std::string& payload) {
  out += "{\"";
  out += tag;
  out += "\": ";
  AppendString(out, payload);
  out.push_back('}');
}

void AppendValue(std::string& out, const Value& value);

void AppendMap(std::string& out, const MapValue& map) {
  std::vector<const std::string*> keys;
  keys.reserve(static_cast<size_t>(map.fields_size()));
  for (const auto& [key, _] : map.fields()) {
    keys.push_back(&key);
  }
  std::sort(keys.begin(), keys.end(), [](const std::string* a, const std::string* b) { return *a < *b; });

  out.push_back('{');
  bool first = true;
  for (const auto* key : keys) {
    if (!first) out += ", ";
    first = false;
    AppendString(out, *key);
    out += ": ";
    AppendValue(out, map.fields().at(*key));
  }
  out.push_back('}');
}

void AppendValue(std::string& out, const Value& value) {
  switch (value.kind_case()) {
    case Value::kNullValue:
      out += "null";
      break;
    case Value::kBoolValue:
      out += value.bool_value() ? "true" : "false";
      break;
    case Value::kIntValue:
      out += std::to_string(value.int_value());
      break;
    case Value::kDoubleValue:
      AppendDouble(out, value.double_value());
      break;
    case Value::kStringValue:
      AppendString(out, value.string_value());
      break;
    case Value::kBytesValue:
      AppendTagged(out, "__bytes__", Base64(value.bytes_value()));
      break;
    case Value::kTimestampValue:
      AppendTagged(out, "__datetime__", google::protobuf::util::TimeUtil::ToString(value.timestamp_value()));
      break;
    case Value::kDecimalValue:
      AppendTagged(out, "__decimal__", value.decimal_value().digits());
      break;
    case Value::kMapValue:
      AppendMap(out, value.map_value());
      break;
    case Value::kListValue: {
      out.push_back('[');
      bool first = true;
      for (const auto& item : value.list_value().values()) {
        if (!first) out += ", ";
        first = false;
        AppendValue(out, item);
      }
      out.push_back(']');
      break;
    }
    case Value::KIND_NOT_SET:
      throw util::CodecError("value without kind");
  }
}

} // namespace

std::string CanonicalJson(const Value& value) {
  StateCodec::Validate(value);
  std::string out;
  AppendValue(out, value);
  return out;
}

std::string CanonicalJson(const MapValue& map) {
  StateCodec::Validate(map);
  std::string out;
  AppendMap(out, map);
  return out;
}

} // namespace jobguard::state
