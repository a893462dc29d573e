#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace pagequeue::util {

/*
  Time utilities: the single place that controls the clock source.

  Components that make time-based decisions take a NowFn so tests can
  drive the clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using NowFn     = std::function<TimePoint()>;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

// RFC 3339 / ISO-8601, UTC.
std::string ToIso8601(TimePoint tp);

} // namespace pagequeue::util
