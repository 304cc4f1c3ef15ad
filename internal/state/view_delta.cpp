#include "view_delta.hpp"

#include <algorithm>

namespace mvtracker::state {

int64_t ComputeDeltaAndUpdate(StateMap& state, const std::string& group_id, const std::string& video_id, int64_t current_view,
                              const std::optional<std::string>& title) {
  int64_t                    delta = 0;
  std::optional<std::string> cached_title;

  auto it = state.find(group_id);
  if (it != state.end()) {
    if (it->second.video_id == video_id) {
      // a decrease is an upstream inconsistency, not a real drop
      delta = std::max<int64_t>(0, current_view - it->second.last_view);
    }
    cached_title = it->second.title;
  }

  GroupState updated;
  updated.video_id  = video_id;
  updated.last_view = current_view;
  if (title && !title->empty()) {
    updated.title = title;
  } else if (cached_title && !cached_title->empty()) {
    updated.title = std::move(cached_title);
  }

  state[group_id] = std::move(updated);
  return delta;
}

} // namespace mvtracker::state
