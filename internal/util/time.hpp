#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include "google/protobuf/timestamp.pb.h"

namespace jobguard::util {

/*
  Time utilities. Components that reason about staleness take a NowFn
  so tests can move the clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using NowFn     = std::function<TimePoint()>;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

google::protobuf::Timestamp MillisToProto(uint64_t ms);

} // namespace jobguard::util
