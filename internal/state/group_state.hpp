#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace mvtracker::state {

/*
  Last observation persisted for one group.

  last_view always belongs to video_id: a changeover replaces both at once.
*/
struct GroupState {
  std::string                video_id;
  int64_t                    last_view = 0;
  std::optional<std::string> title;

  bool operator==(const GroupState&) const = default;
};

// Keyed by group id. Ordered so persisted output is stable.
using StateMap = std::map<std::string, GroupState>;

} // namespace mvtracker::state
