#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace mvtracker::catalog {

// One search hit. Retrieval order carries the recency rank (newest first).
struct VideoCandidate {
  std::string video_id;
  std::string title;
  std::string published_at;
};

struct VideoStatistics {
  int64_t     view_count = 0;
  std::string title;
};

// contentDetails.duration of one video. `iso` is empty when the catalog
// sent none; `seconds` is empty when it is absent or could not be parsed.
struct VideoDuration {
  std::string                         iso;
  std::optional<std::chrono::seconds> seconds;

  bool Present() const {
    return !iso.empty();
  }
};

// The video chosen to represent a group's current official MV.
struct ResolvedVideo {
  std::string video_id;
  std::string title;
};

std::string WatchUrl(const std::string& video_id);

} // namespace mvtracker::catalog
