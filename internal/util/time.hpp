#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace dispatch::util {

/*
  Time utilities. All clock reads go through Now().

  Persistent records carry unix milliseconds; 0 means "not set".
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();
uint64_t  NowMillis();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// Copies a unix-millis column into a Timestamp field; leaves it unset for 0.
void SetTimestamp(uint64_t ms, google::protobuf::Timestamp* out);

} // namespace dispatch::util
