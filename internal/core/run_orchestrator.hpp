#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "internal/state/group_state.hpp"
#include "internal/util/time.hpp"

namespace mvtracker::catalog {
class VideoCatalog;
}
namespace mvtracker::resolver {
class MvResolver;
}
namespace mvtracker::sink {
class MetricSink;
}
namespace mvtracker::state {
class StateStore;
}

namespace mvtracker::core {

struct Group {
  std::string id;
  std::string name;       // search keyword, matched against titles
  std::string channel_id;
};

struct RunSettings {
  std::vector<Group> groups;
  std::string        metric_namespace = "kpop.youtube";
  bool               save_each_group  = false;
};

enum class GroupStatus {
  kResolved,      // fresh resolution, metrics posted
  kUsedCache,     // cached video, metrics posted
  kSkippedNoData, // nothing to report on, no metrics
  kSinkFailed,    // metrics not (fully) accepted, state untouched
  kAborted,       // quota exhausted, run stops here
};

const char* ToString(GroupStatus status);

struct GroupOutcome {
  std::string group_id;
  GroupStatus status = GroupStatus::kSkippedNoData;
  std::string video_id;
  std::string title;
  int64_t     view_count = 0;
  int64_t     delta      = 0;
  std::string detail;
};

struct RunReport {
  bool                      search_run = false;
  bool                      aborted    = false;
  std::vector<GroupOutcome> outcomes;

  std::size_t Count(GroupStatus status) const;
};

std::string ViewCountMetricName(const std::string& metric_namespace, const std::string& group_id, const std::string& video_id);
std::string ViewDeltaMetricName(const std::string& metric_namespace, const std::string& group_id, const std::string& video_id);

/*
  Runs one reporting pass over every configured group, sequentially.

  Per group:
    search run  -> resolve; on no result fall back to the cached video
    cache run   -> cached video
    no video    -> SkippedNoData
    statistics  -> post absolute count, post delta, commit state

  util::QuotaExceeded from any catalog call ends the run (Aborted); every
  other catalog or sink failure only affects its group. State is saved
  once at the end, including after an abort.
*/
class RunOrchestrator {
 public:
  using ClockFn = std::function<util::TimePoint()>;

  RunOrchestrator(RunSettings settings, std::shared_ptr<resolver::MvResolver> resolver, std::shared_ptr<catalog::VideoCatalog> catalog,
                  std::shared_ptr<state::StateStore> store, std::shared_ptr<sink::MetricSink> sink, ClockFn clock = util::Now);

  RunReport Run(bool search_run);

 private:
  GroupOutcome ProcessGroup(const Group& group, bool search_run, state::StateMap& state);

  const RunSettings                     settings_;
  std::shared_ptr<resolver::MvResolver> resolver_;
  std::shared_ptr<catalog::VideoCatalog> catalog_;
  std::shared_ptr<state::StateStore>    store_;
  std::shared_ptr<sink::MetricSink>     sink_;
  ClockFn                               clock_;
};

void LogReport(const RunReport& report);

} // namespace mvtracker::core
