#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "internal/catalog/model.hpp"
#include "internal/resolver/title_rules.hpp"

namespace mvtracker::catalog {
class VideoCatalog;
}

namespace mvtracker::resolver {

/*
  Picks the video that represents a group's latest official MV.

    1. search the channel for the group name (newest first)
    2. first candidate passing TitleRules::MatchesPrimary is tentative
    3. a tentative match shorter than min_duration is a short-form clip;
       the raw results after the first are rescanned with MatchesRelaxed
       and the first one that has a duration and is not short-form wins
    4. a duration that is missing or unparsable never marks a video as
       short-form, so the tentative match is then accepted

  util::QuotaExceeded always propagates. Any other search failure also
  propagates; the caller decides whether to fall back to cached state.
*/
class MvResolver {
 public:
  MvResolver(std::shared_ptr<catalog::VideoCatalog> catalog, TitleRules rules,
             std::chrono::seconds min_duration = std::chrono::seconds(60));

  std::optional<catalog::ResolvedVideo> Resolve(const std::string& channel_id, const std::string& group_name) const;

 private:
  // Not present when the lookup failed for a reason other than quota
  // exhaustion.
  catalog::VideoDuration TryFetchDuration(const std::string& video_id) const;

  bool IsShortForm(const catalog::VideoDuration& duration) const;

  std::shared_ptr<catalog::VideoCatalog> catalog_;
  TitleRules                             rules_;
  std::chrono::seconds                   min_duration_;
};

} // namespace mvtracker::resolver
