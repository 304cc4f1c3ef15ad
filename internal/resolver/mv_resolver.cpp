#include "mv_resolver.hpp"

#include "internal/catalog/video_catalog.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace mvtracker::resolver {

using mvtracker::catalog::ResolvedVideo;
using mvtracker::catalog::VideoCandidate;
using mvtracker::observability::IntField;
using mvtracker::observability::StringField;

MvResolver::MvResolver(std::shared_ptr<catalog::VideoCatalog> catalog, TitleRules rules, std::chrono::seconds min_duration)
    : catalog_(std::move(catalog)), rules_(std::move(rules)), min_duration_(min_duration) {
}

catalog::VideoDuration MvResolver::TryFetchDuration(const std::string& video_id) const {
  try {
    return catalog_->FetchDuration(video_id);
  } catch (const util::QuotaExceeded&) {
    throw;
  } catch (const util::CatalogError& e) {
    MVTRACKER_LOG_WARN("Duration lookup failed", {StringField("video_id", video_id), StringField("error", e.what())});
    return {};
  }
}

bool MvResolver::IsShortForm(const catalog::VideoDuration& duration) const {
  return duration.seconds && *duration.seconds < min_duration_;
}

std::optional<ResolvedVideo> MvResolver::Resolve(const std::string& channel_id, const std::string& group_name) const {
  const auto candidates = catalog_->SearchRecentVideos(channel_id, group_name);
  MVTRACKER_LOG_DEBUG("Search returned candidates",
                      {StringField("keyword", group_name), IntField("count", static_cast<int64_t>(candidates.size()))});
  if (candidates.empty()) {
    return std::nullopt;
  }

  const VideoCandidate* tentative = nullptr;
  for (const auto& candidate : candidates) {
    if (rules_.MatchesPrimary(candidate.title, group_name)) {
      tentative = &candidate;
      break;
    }
  }
  if (!tentative) {
    return std::nullopt;
  }

  const auto duration = TryFetchDuration(tentative->video_id);
  if (!IsShortForm(duration)) {
    return ResolvedVideo{tentative->video_id, tentative->title};
  }

  MVTRACKER_LOG_INFO("Rejected short-form candidate",
                     {StringField("video_id", tentative->video_id), IntField("duration_s", duration.seconds->count())});

  // The rescan starts after the first raw result, not after the tentative
  // match, and does not apply the exclusion vocabulary. An unparsable
  // duration passes here too; only a missing one disqualifies.
  for (std::size_t i = 1; i < candidates.size(); ++i) {
    const auto& candidate = candidates[i];
    if (!rules_.MatchesRelaxed(candidate.title, group_name)) {
      continue;
    }
    MVTRACKER_LOG_DEBUG("Rescan candidate", {StringField("video_id", candidate.video_id), StringField("title", candidate.title)});

    const auto candidate_duration = TryFetchDuration(candidate.video_id);
    if (candidate_duration.Present() && !IsShortForm(candidate_duration)) {
      return ResolvedVideo{candidate.video_id, candidate.title};
    }
  }

  return std::nullopt;
}

} // namespace mvtracker::resolver
