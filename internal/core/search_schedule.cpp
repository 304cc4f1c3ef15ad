#include "search_schedule.hpp"

#include <algorithm>

#include "config/config.pb.h"

namespace mvtracker::core {

bool IsSearchRun(const mvtracker::runtime::config::ScheduleConfig& schedule, util::TimePoint now, SearchMode mode) {
  switch (mode) {
    case SearchMode::kForceSearch:
      return true;
    case SearchMode::kCacheOnly:
      return false;
    case SearchMode::kSchedule:
      break;
  }

  const auto hour  = static_cast<uint32_t>(util::HourAtOffset(now, schedule.utc_offset_hours()));
  const auto& hours = schedule.search_hours();
  return std::find(hours.begin(), hours.end(), hour) != hours.end();
}

} // namespace mvtracker::core
