#pragma once

#include <chrono>
#include <cstdint>

namespace mvtracker::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

int64_t ToUnixSeconds(TimePoint tp);

// Hour of day (0-23) at a fixed offset from UTC.
int HourAtOffset(TimePoint tp, int utc_offset_hours);

} // namespace mvtracker::util
