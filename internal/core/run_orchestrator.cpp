#include "run_orchestrator.hpp"

#include <algorithm>
#include <optional>

#include "internal/catalog/video_catalog.hpp"
#include "internal/observability/logging.hpp"
#include "internal/resolver/mv_resolver.hpp"
#include "internal/sink/metric_sink.hpp"
#include "internal/state/state_store.hpp"
#include "internal/state/view_delta.hpp"
#include "internal/util/errors.hpp"

namespace mvtracker::core {

using mvtracker::catalog::ResolvedVideo;
using mvtracker::catalog::VideoStatistics;
using mvtracker::observability::BoolField;
using mvtracker::observability::IntField;
using mvtracker::observability::StringField;

const char* ToString(GroupStatus status) {
  switch (status) {
    case GroupStatus::kResolved:
      return "resolved";
    case GroupStatus::kUsedCache:
      return "used_cache";
    case GroupStatus::kSkippedNoData:
      return "skipped_no_data";
    case GroupStatus::kSinkFailed:
      return "sink_failed";
    case GroupStatus::kAborted:
      return "aborted";
  }
  return "unknown";
}

std::size_t RunReport::Count(GroupStatus status) const {
  return static_cast<std::size_t>(
      std::count_if(outcomes.begin(), outcomes.end(), [status](const GroupOutcome& o) { return o.status == status; }));
}

std::string ViewCountMetricName(const std::string& metric_namespace, const std::string& group_id, const std::string& video_id) {
  return metric_namespace + ".viewcount." + group_id + "_" + video_id;
}

std::string ViewDeltaMetricName(const std::string& metric_namespace, const std::string& group_id, const std::string& video_id) {
  return metric_namespace + ".viewdelta." + group_id + "_" + video_id;
}

RunOrchestrator::RunOrchestrator(RunSettings settings, std::shared_ptr<resolver::MvResolver> resolver,
                                 std::shared_ptr<catalog::VideoCatalog> catalog, std::shared_ptr<state::StateStore> store,
                                 std::shared_ptr<sink::MetricSink> sink, ClockFn clock)
    : settings_(std::move(settings)),
      resolver_(std::move(resolver)),
      catalog_(std::move(catalog)),
      store_(std::move(store)),
      sink_(std::move(sink)),
      clock_(std::move(clock)) {
}

// ------------------------------------------------------------
// Run
// ------------------------------------------------------------

RunReport RunOrchestrator::Run(bool search_run) {
  RunReport report;
  report.search_run = search_run;

  auto state = store_->Load();
  MVTRACKER_LOG_INFO("Run started", {BoolField("search_run", search_run), IntField("groups", static_cast<int64_t>(settings_.groups.size())),
                                     IntField("cached_entries", static_cast<int64_t>(state.size()))});

  try {
    for (const auto& group : settings_.groups) {
      auto outcome = ProcessGroup(group, search_run, state);
      const bool aborted = outcome.status == GroupStatus::kAborted;
      report.outcomes.push_back(std::move(outcome));

      if (aborted) {
        report.aborted = true;
        break;
      }
      if (settings_.save_each_group) {
        store_->Save(state);
      }
    }
  } catch (const std::exception& e) {
    MVTRACKER_LOG_ERROR("Run interrupted, persisting state", {StringField("error", e.what())});
    store_->Save(state);
    throw;
  }

  store_->Save(state);
  return report;
}

// ------------------------------------------------------------
// Per group
// ------------------------------------------------------------

GroupOutcome RunOrchestrator::ProcessGroup(const Group& group, bool search_run, state::StateMap& state) {
  GroupOutcome outcome;
  outcome.group_id = group.id;

  MVTRACKER_LOG_INFO("Processing group", {StringField("group", group.id), StringField("name", group.name)});

  try {
    std::optional<ResolvedVideo> target;
    if (search_run) {
      try {
        target = resolver_->Resolve(group.channel_id, group.name);
      } catch (const util::QuotaExceeded&) {
        throw;
      } catch (const util::CatalogError& e) {
        MVTRACKER_LOG_WARN("Search failed", {StringField("group", group.id), StringField("kind", util::ToString(e.kind())),
                                             StringField("error", e.what())});
      }
      if (!target) {
        MVTRACKER_LOG_INFO("No MV-like video found, trying cache", {StringField("group", group.id)});
      }
    }

    outcome.status = GroupStatus::kResolved;
    if (!target) {
      auto cached = state.find(group.id);
      if (cached == state.end()) {
        outcome.status = GroupStatus::kSkippedNoData;
        outcome.detail = search_run ? "no qualifying video and no cached video" : "no cached video until the next search run";
        MVTRACKER_LOG_INFO("Skipping group", {StringField("group", group.id), StringField("reason", outcome.detail)});
        return outcome;
      }
      target         = ResolvedVideo{cached->second.video_id, cached->second.title.value_or("")};
      outcome.status = GroupStatus::kUsedCache;
    }

    outcome.video_id = target->video_id;
    outcome.title    = target->title;
    MVTRACKER_LOG_INFO("Selected video", {StringField("group", group.id), StringField("source", ToString(outcome.status)),
                                          StringField("video_id", target->video_id), StringField("title", target->title),
                                          StringField("url", catalog::WatchUrl(target->video_id))});

    VideoStatistics stats;
    try {
      stats = catalog_->FetchStatistics(target->video_id);
    } catch (const util::QuotaExceeded&) {
      throw;
    } catch (const util::CatalogError& e) {
      outcome.status = GroupStatus::kSkippedNoData;
      outcome.detail = std::string("statistics unavailable: ") + e.what();
      MVTRACKER_LOG_WARN("Skipping group", {StringField("group", group.id), StringField("kind", util::ToString(e.kind())),
                                            StringField("reason", outcome.detail)});
      return outcome;
    }

    if (outcome.title.empty()) {
      outcome.title = stats.title;
    }
    outcome.view_count = stats.view_count;

    // Stage the update so a rejected metric leaves the stored baseline intact.
    state::StateMap staged;
    if (auto cached = state.find(group.id); cached != state.end()) {
      staged.emplace(cached->first, cached->second);
    }
    std::optional<std::string> title;
    if (!outcome.title.empty()) {
      title = outcome.title;
    }
    outcome.delta = state::ComputeDeltaAndUpdate(staged, group.id, target->video_id, stats.view_count, title);

    const auto timestamp   = util::ToUnixSeconds(clock_());
    const auto count_name  = ViewCountMetricName(settings_.metric_namespace, group.id, target->video_id);
    const auto delta_name  = ViewDeltaMetricName(settings_.metric_namespace, group.id, target->video_id);

    try {
      sink_->Post({count_name, timestamp, static_cast<double>(stats.view_count)});
      MVTRACKER_LOG_INFO("Posted view count", {StringField("group", group.id), StringField("metric", count_name),
                                               IntField("value", stats.view_count)});

      sink_->Post({delta_name, timestamp, static_cast<double>(outcome.delta)});
      MVTRACKER_LOG_INFO("Posted view delta", {StringField("group", group.id), StringField("metric", delta_name),
                                               IntField("value", outcome.delta)});
    } catch (const util::SinkError& e) {
      outcome.status = GroupStatus::kSinkFailed;
      outcome.detail = e.what();
      MVTRACKER_LOG_ERROR("Metric post failed", {StringField("group", group.id), IntField("delta", outcome.delta),
                                                 StringField("error", e.what())});
      return outcome;
    }

    state[group.id] = staged.at(group.id);
    return outcome;
  } catch (const util::QuotaExceeded& e) {
    outcome.status = GroupStatus::kAborted;
    outcome.detail = e.what();
    MVTRACKER_LOG_ERROR("Catalog quota exhausted, stopping remaining groups", {StringField("group", group.id), StringField("error", e.what())});
    return outcome;
  }
}

// ------------------------------------------------------------
// Report
// ------------------------------------------------------------

void LogReport(const RunReport& report) {
  for (const auto& outcome : report.outcomes) {
    MVTRACKER_LOG_INFO("Group result", {StringField("group", outcome.group_id), StringField("status", ToString(outcome.status)),
                                        StringField("video_id", outcome.video_id), IntField("views", outcome.view_count),
                                        IntField("delta", outcome.delta), StringField("detail", outcome.detail)});
  }

  MVTRACKER_LOG_INFO("Run finished",
                     {BoolField("search_run", report.search_run), BoolField("aborted", report.aborted),
                      IntField("resolved", static_cast<int64_t>(report.Count(GroupStatus::kResolved))),
                      IntField("used_cache", static_cast<int64_t>(report.Count(GroupStatus::kUsedCache))),
                      IntField("skipped", static_cast<int64_t>(report.Count(GroupStatus::kSkippedNoData))),
                      IntField("sink_failed", static_cast<int64_t>(report.Count(GroupStatus::kSinkFailed)))});
}

} // namespace mvtracker::core
