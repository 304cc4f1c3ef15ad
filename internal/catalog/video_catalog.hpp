#pragma once

#include <string>
#include <vector>

#include "internal/catalog/model.hpp"

namespace mvtracker::catalog {

/*
  External video catalog.

  All calls throw util::CatalogError on failure; quota exhaustion is
  raised as the util::QuotaExceeded subclass.
*/
class VideoCatalog {
 public:
  virtual ~VideoCatalog() = default;

  // Newest first, at most one page of results.
  virtual std::vector<VideoCandidate> SearchRecentVideos(const std::string& channel_id, const std::string& keyword) = 0;

  virtual VideoDuration FetchDuration(const std::string& video_id) = 0;

  virtual VideoStatistics FetchStatistics(const std::string& video_id) = 0;
};

} // namespace mvtracker::catalog
