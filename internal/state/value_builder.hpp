#pragma once

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>

#include "internal/util/time.hpp"
#include "jobguard/core/v1/value.pb.h"

namespace jobguard::state {

using core::v1::ListValue;
using core::v1::MapValue;
using core::v1::Value;

Value MakeNull();
Value MakeBool(bool v);
Value MakeInt(int64_t v);
Value MakeDouble(double v);
Value MakeString(std::string v);
Value MakeBytes(std::string v);
Value MakeTimestamp(util::TimePoint tp);
Value MakeDecimal(std::string digits);
Value MakeList(std::initializer_list<Value> values);
Value MakeMap(std::initializer_list<std::pair<std::string, Value>> fields);

MapValue MapOf(std::initializer_list<std::pair<std::string, Value>> fields);

// Lookups return nullopt when the key is absent or holds another kind.
const Value*               Find(const MapValue& map, const std::string& key);
std::optional<int64_t>     GetInt(const MapValue& map, const std::string& key);
std::optional<std::string> GetString(const MapValue& map, const std::string& key);

} // namespace jobguard::state
