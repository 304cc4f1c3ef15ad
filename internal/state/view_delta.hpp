#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/state/group_state.hpp"

namespace mvtracker::state {

/*
  Returns the view growth of video_id since the stored observation and
  overwrites the group's entry with the new one.

  - same video: max(0, current_view - last_view)
  - first observation or changeover: 0
  - title: the given one, else the previously cached one
*/
int64_t ComputeDeltaAndUpdate(StateMap& state, const std::string& group_id, const std::string& video_id, int64_t current_view,
                              const std::optional<std::string>& title = std::nullopt);

} // namespace mvtracker::state
