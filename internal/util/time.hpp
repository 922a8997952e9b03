#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace evolve::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(TimePoint tp);

// Program timestamps are persisted with microsecond resolution.
int64_t   ToUnixMicros(TimePoint tp);
TimePoint FromUnixMicros(int64_t micros);

// "YYYY-MM-DD HH:MM" in local time, for operator output.
std::string FormatMinutes(TimePoint tp);

} // namespace evolve::util
