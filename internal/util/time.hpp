#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace snapshot::util {

/*
  Time utilities — single place to control clock source later.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// MS-DOS date/time pair used by zip headers (local time, 2 second resolution).
struct DosDateTime {
  uint16_t time = 0;
  uint16_t date = 0;
};

DosDateTime ToDosDateTime(TimePoint tp);

} // namespace snapshot::util
