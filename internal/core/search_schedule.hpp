#pragma once

#include "internal/util/time.hpp"

namespace mvtracker::runtime::config {
class ScheduleConfig;
}

namespace mvtracker::core {

enum class SearchMode {
  kSchedule,
  kForceSearch,
  kCacheOnly,
};

// A search run performs fresh MV resolution; any other run reports on the
// cached videos only, which keeps search quota usage to a few runs a day.
bool IsSearchRun(const mvtracker::runtime::config::ScheduleConfig& schedule, util::TimePoint now, SearchMode mode);

} // namespace mvtracker::core
