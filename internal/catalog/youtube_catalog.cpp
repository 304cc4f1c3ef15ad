#include "youtube_catalog.hpp"

#include <google/protobuf/util/json_util.h>

#include <unordered_set>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/iso_duration.hpp"
#include "mvtracker/catalog/v1/youtube.pb.h"

namespace mvtracker::catalog {

using mvtracker::observability::IntField;
using mvtracker::observability::StringField;
using mvtracker::util::CatalogError;

namespace {

template <typename Message>
Message ParseBody(const std::string& operation, const http::HttpResponse& response) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  Message message;
  auto    status = google::protobuf::util::JsonStringToMessage(response.body, &message, options);
  if (!status.ok()) {
    throw CatalogError(CatalogError::Kind::kOther, response.status, "invalidResponse",
                       operation + " returned an unparsable body: " + std::string(status.message()));
  }
  return message;
}

const v1::Video& RequireSingleVideo(const std::string& operation, const std::string& video_id, const v1::VideoListResponse& response) {
  if (response.items().empty()) {
    throw CatalogError(CatalogError::Kind::kNotFound, 200, "videoNotFound", operation + ": no video with id " + video_id);
  }
  return response.items(0);
}

} // namespace

std::string WatchUrl(const std::string& video_id) {
  return "https://www.youtube.com/watch?v=" + video_id;
}

YouTubeCatalog::YouTubeCatalog(YouTubeCatalogOptions options, std::shared_ptr<http::HttpClient> http)
    : options_(std::move(options)), http_(std::move(http)) {
}

bool YouTubeCatalog::IsQuotaReason(const std::string& reason) {
  static const std::unordered_set<std::string> kQuotaReasons = {
      "quotaExceeded",
      "dailyLimitExceeded",
      "dailyLimitExceededUnreg",
      "userRateLimitExceeded",
  };
  return kQuotaReasons.count(reason) > 0;
}

void YouTubeCatalog::ThrowForResponse(const std::string& operation, const http::HttpResponse& response) {
  std::string reason;
  std::string message;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  v1::ErrorResponse error;
  if (google::protobuf::util::JsonStringToMessage(response.body, &error, options).ok()) {
    if (!error.error().errors().empty()) {
      reason = error.error().errors(0).reason();
    }
    message = error.error().message();
  }
  if (message.empty()) {
    message = response.body;
  }

  MVTRACKER_LOG_ERROR("YouTube API call failed", {StringField("operation", operation), IntField("status", response.status),
                                                  StringField("reason", reason), StringField("message", message)});

  const std::string what = operation + " failed (status=" + std::to_string(response.status) + ", reason=" + reason + "): " + message;

  if (IsQuotaReason(reason)) {
    throw util::QuotaExceeded(response.status, reason, what);
  }
  if (response.status == 404) {
    throw CatalogError(CatalogError::Kind::kNotFound, response.status, reason, what);
  }
  throw CatalogError(CatalogError::Kind::kOther, response.status, reason, what);
}

http::HttpResponse YouTubeCatalog::Call(const std::string& operation, const std::string& resource, http::QueryParams params) {
  params.emplace_back("key", options_.api_key);

  http::HttpResponse response;
  try {
    response = http_->Get(options_.base_url + "/" + resource, params, {});
  } catch (const util::TransportError& e) {
    throw CatalogError(CatalogError::Kind::kOther, 0, "transport", operation + ": " + e.what());
  }

  if (!response.Ok()) {
    ThrowForResponse(operation, response);
  }
  return response;
}

// ------------------------------------------------------------
// search.list
// ------------------------------------------------------------

std::vector<VideoCandidate> YouTubeCatalog::SearchRecentVideos(const std::string& channel_id, const std::string& keyword) {
  const std::string operation = "search.list";

  auto response = Call(operation, "search",
                       {
                           {"part", "snippet"},
                           {"channelId", channel_id},
                           {"q", keyword},
                           {"type", "video"},
                           {"order", "date"},
                           {"maxResults", std::to_string(options_.max_results)},
                       });

  const auto parsed = ParseBody<v1::SearchListResponse>(operation, response);

  std::vector<VideoCandidate> candidates;
  candidates.reserve(parsed.items_size());
  for (const auto& item : parsed.items()) {
    if (item.id().video_id().empty()) {
      continue;
    }
    candidates.push_back({item.id().video_id(), item.snippet().title(), item.snippet().published_at()});
  }
  return candidates;
}

// ------------------------------------------------------------
// videos.list
// ------------------------------------------------------------

VideoDuration YouTubeCatalog::FetchDuration(const std::string& video_id) {
  const std::string operation = "videos.list(contentDetails)";

  auto response = Call(operation, "videos", {{"part", "contentDetails"}, {"id", video_id}});

  const auto  parsed = ParseBody<v1::VideoListResponse>(operation, response);
  const auto& video  = RequireSingleVideo(operation, video_id, parsed);

  VideoDuration duration;
  duration.iso = video.content_details().duration();
  if (duration.iso.empty()) {
    return duration;
  }

  duration.seconds = util::ParseIsoDuration(duration.iso);
  if (!duration.seconds) {
    MVTRACKER_LOG_WARN("Unparsable video duration", {StringField("video_id", video_id), StringField("duration", duration.iso)});
  }
  return duration;
}

VideoStatistics YouTubeCatalog::FetchStatistics(const std::string& video_id) {
  const std::string operation = "videos.list(statistics)";

  auto response = Call(operation, "videos", {{"part", "statistics,snippet"}, {"id", video_id}});

  const auto  parsed = ParseBody<v1::VideoListResponse>(operation, response);
  const auto& video  = RequireSingleVideo(operation, video_id, parsed);

  VideoStatistics stats;
  stats.view_count = video.statistics().view_count();
  stats.title      = video.snippet().title();
  return stats;
}

} // namespace mvtracker::catalog
