#include "value_builder.hpp"

namespace jobguard::state {

Value MakeNull() {
  Value v;
  v.set_null_value(core::v1::NULL_VALUE);
  return v;
}

Value MakeBool(bool b) {
  Value v;
  v.set_bool_value(b);
  return v;
}

Value MakeInt(int64_t i) {
  Value v;
  v.set_int_value(i);
  return v;
}

Value MakeDouble(double d) {
  Value v;
  v.set_double_value(d);
  return v;
}

Value MakeString(std::string s) {
  Value v;
  v.set_string_value(std::move(s));
  return v;
}

Value MakeBytes(std::string b) {
  Value v;
  v.set_bytes_value(std::move(b));
  return v;
}

Value MakeTimestamp(util::TimePoint tp) {
  Value v;
  *v.mutable_timestamp_value() = util::ToProto(tp);
  return v;
}

Value MakeDecimal(std::string digits) {
  Value v;
  v.mutable_decimal_value()->set_digits(std::move(digits));
  return v;
}

Value MakeList(std::initializer_list<Value> values) {
  Value v;
  auto* list = v.mutable_list_value();
  for (const auto& item : values) {
    *list->add_values() = item;
  }
  return v;
}

MapValue MapOf(std::initializer_list<std::pair<std::string, Value>> fields) {
  MapValue map;
  for (const auto& [key, value] : fields) {
    (*map.mutable_fields())[key] = value;
  }
  return map;
}

Value MakeMap(std::initializer_list<std::pair<std::string, Value>> fields) {
  Value v;
  *v.mutable_map_value() = MapOf(fields);
  return v;
}

const Value* Find(const MapValue& map, const std::string& key) {
  auto it = map.fields().find(key);
  if (it == map.fields().end()) return nullptr;
  return &it->second;
}

std::optional<int64_t> GetInt(const MapValue& map, const std::string& key) {
  const auto* v = Find(map, key);
  if (!v || v->kind_case() != Value::kIntValue) return std::nullopt;
  return v->int_value();
}

std::optional<std::string> GetString(const MapValue& map, const std::string& key) {
  const auto* v = Find(map, key);
  if (!v || v->kind_case() != Value::kStringValue) return std::nullopt;
  return v->string_value();
}

} // namespace jobguard::state
