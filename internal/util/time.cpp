#include "time.hpp"

namespace mvtracker::util {

TimePoint Now() {
  return Clock::now();
}

int64_t ToUnixSeconds(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

int HourAtOffset(TimePoint tp, int utc_offset_hours) {
  constexpr int64_t kSecondsPerDay = 24 * 3600;

  int64_t seconds_of_day = (ToUnixSeconds(tp) + int64_t{utc_offset_hours} * 3600) % kSecondsPerDay;
  if (seconds_of_day < 0) {
    seconds_of_day += kSecondsPerDay;
  }
  return static_cast<int>(seconds_of_day / 3600);
}

} // namespace mvtracker::util
