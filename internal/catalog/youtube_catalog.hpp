#pragma once

#include <memory>
#include <string>

#include "internal/catalog/video_catalog.hpp"
#include "internal/http/http_client.hpp"

namespace mvtracker::catalog {

struct YouTubeCatalogOptions {
  std::string base_url = "https://www.googleapis.com/youtube/v3";
  std::string api_key;
  uint32_t    max_results = 50;
};

/*
  YouTube Data API v3 client (search.list and videos.list).
*/
class YouTubeCatalog final : public VideoCatalog {
 public:
  YouTubeCatalog(YouTubeCatalogOptions options, std::shared_ptr<http::HttpClient> http);

  std::vector<VideoCandidate> SearchRecentVideos(const std::string& channel_id, const std::string& keyword) override;

  VideoDuration FetchDuration(const std::string& video_id) override;

  VideoStatistics FetchStatistics(const std::string& video_id) override;

  // Maps a non-2xx response to the matching CatalogError and throws it.
  [[noreturn]] static void ThrowForResponse(const std::string& operation, const http::HttpResponse& response);

  static bool IsQuotaReason(const std::string& reason);

 private:
  http::HttpResponse Call(const std::string& operation, const std::string& resource, http::QueryParams params);

  YouTubeCatalogOptions             options_;
  std::shared_ptr<http::HttpClient> http_;
};

} // namespace mvtracker::catalog
