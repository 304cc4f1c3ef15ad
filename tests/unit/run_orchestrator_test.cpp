#include "internal/core/run_orchestrator.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

#include "fake_catalog.hpp"
#include "internal/resolver/mv_resolver.hpp"
#include "internal/sink/metric_sink.hpp"
#include "internal/state/memory_state_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using mvtracker::core::Group;
using mvtracker::core::GroupStatus;
using mvtracker::core::RunOrchestrator;
using mvtracker::core::RunSettings;
using mvtracker::resolver::MvResolver;
using mvtracker::resolver::TitleRules;
using mvtracker::sink::MetricPoint;
using mvtracker::state::GroupState;
using mvtracker::state::MemoryStateStore;
using mvtracker::state::StateMap;
using mvtracker::testing::FakeCatalog;

constexpr int64_t kNow = 1700000000;

class RecordingSink final : public mvtracker::sink::MetricSink {
 public:
  std::vector<MetricPoint>        points;
  std::unordered_set<std::string> reject_names;
  std::unordered_set<std::string> broken_names;

  void Post(const MetricPoint& point) override {
    if (broken_names.count(point.name)) {
      throw std::logic_error("encoder broke on " + point.name);
    }
    if (reject_names.count(point.name)) {
      throw mvtracker::util::SinkError(500, "rejected " + point.name);
    }
    points.push_back(point);
  }

  const MetricPoint* Find(const std::string& name) const {
    for (const auto& point : points) {
      if (point.name == name) return &point;
    }
    return nullptr;
  }
};

struct Harness {
  std::shared_ptr<FakeCatalog>      catalog = std::make_shared<FakeCatalog>();
  std::shared_ptr<MemoryStateStore> store;
  std::shared_ptr<RecordingSink>    sink = std::make_shared<RecordingSink>();
  RunSettings                       settings;

  explicit Harness(StateMap initial = {}) : store(std::make_shared<MemoryStateStore>(std::move(initial))) {
    settings.metric_namespace = "kpop.youtube";
  }

  void AddGroup(const std::string& id, const std::string& name) {
    settings.groups.push_back(Group{id, name, "channel-" + id});
  }

  RunOrchestrator Build() {
    auto resolver = std::make_shared<MvResolver>(catalog, TitleRules::Defaults());
    return RunOrchestrator(settings, resolver, catalog, store, sink,
                           [] { return mvtracker::util::TimePoint(std::chrono::seconds(kNow)); });
  }
};

void TestSearchRunPostsAbsoluteAndDeltaForResolvedVideo() {
  Harness h({{"ive", GroupState{"A", 100, std::string("IVE 'I AM' MV")}}});
  h.AddGroup("ive", "IVE");
  h.catalog->search_results["IVE"] = {{"A", "IVE 'I AM' MV", ""}};
  h.catalog->durations["A"]        = 180;
  h.catalog->statistics["A"]       = {150, "IVE 'I AM' MV"};

  const auto report = h.Build().Run(/*search_run=*/true);

  assert(!report.aborted);
  assert(report.outcomes.size() == 1);
  assert(report.outcomes[0].status == GroupStatus::kResolved);
  assert(report.outcomes[0].delta == 50);

  const auto* count = h.sink->Find("kpop.youtube.viewcount.ive_A");
  const auto* delta = h.sink->Find("kpop.youtube.viewdelta.ive_A");
  assert(count && count->value == 150.0 && count->time == kNow);
  assert(delta && delta->value == 50.0 && delta->time == kNow);

  assert(h.store->committed().at("ive").last_view == 150);
  assert(h.store->save_count() == 1);
}

void TestChangeoverStartsNewSeriesWithZeroDelta() {
  Harness h({{"ive", GroupState{"A", 100, std::nullopt}}});
  h.AddGroup("ive", "IVE");
  h.catalog->search_results["IVE"] = {{"B", "IVE 'XOXZ' MV", ""}};
  h.catalog->durations["B"]        = 200;
  h.catalog->statistics["B"]       = {10, "IVE 'XOXZ' MV"};

  const auto report = h.Build().Run(true);

  assert(report.outcomes[0].delta == 0);
  assert(h.sink->Find("kpop.youtube.viewdelta.ive_B")->value == 0.0);
  assert(h.sink->Find("kpop.youtube.viewcount.ive_A") == nullptr);
  assert((h.store->committed().at("ive") == GroupState{"B", 10, std::string("IVE 'XOXZ' MV")}));
}

void TestCacheRunUsesStoredVideoWithoutSearching() {
  Harness h({{"aespa", GroupState{"W", 1000, std::nullopt}}});
  h.AddGroup("aespa", "aespa");
  h.catalog->statistics["W"] = {1300, "aespa 'Whiplash' MV"};

  const auto report = h.Build().Run(/*search_run=*/false);

  assert(h.catalog->search_calls.empty());
  assert(report.outcomes[0].status == GroupStatus::kUsedCache);
  assert(report.outcomes[0].delta == 300);
  // title backfilled from the statistics call
  assert(report.outcomes[0].title == "aespa 'Whiplash' MV");
  assert(h.store->committed().at("aespa").title == "aespa 'Whiplash' MV");
}

void TestSearchMissFallsBackToCache() {
  Harness h({{"illit", GroupState{"M", 50, std::string("ILLIT 'Magnetic' MV")}}});
  h.AddGroup("illit", "ILLIT");
  h.catalog->search_results["ILLIT"] = {{"x", "ILLIT 'Magnetic' Dance Practice", ""}};
  h.catalog->statistics["M"]         = {75, "ILLIT 'Magnetic' MV"};

  const auto report = h.Build().Run(true);

  assert(report.outcomes[0].status == GroupStatus::kUsedCache);
  assert(report.outcomes[0].video_id == "M");
  assert(report.outcomes[0].delta == 25);
}

void TestSearchFailureFallsBackToCache() {
  Harness h({{"illit", GroupState{"M", 50, std::nullopt}}});
  h.AddGroup("illit", "ILLIT");
  h.catalog->search_failure_keywords.insert("ILLIT");
  h.catalog->statistics["M"] = {60, ""};

  const auto report = h.Build().Run(true);
  assert(report.outcomes[0].status == GroupStatus::kUsedCache);
  assert(report.outcomes[0].delta == 10);
}

void TestNoResolutionAndNoCacheSkipsGroup() {
  Harness h;
  h.AddGroup("new_group", "NEWGROUP");
  h.AddGroup("ive", "IVE");
  h.catalog->search_results["IVE"] = {{"A", "IVE 'I AM' MV", ""}};
  h.catalog->durations["A"]        = 180;
  h.catalog->statistics["A"]       = {5, ""};

  const auto report = h.Build().Run(true);

  assert(report.outcomes.size() == 2);
  assert(report.outcomes[0].status == GroupStatus::kSkippedNoData);
  assert(report.outcomes[1].status == GroupStatus::kResolved);
  assert(h.store->committed().count("new_group") == 0);
  assert(h.sink->points.size() == 2);
}

void TestCacheRunWithoutCacheSkipsGroup() {
  Harness h;
  h.AddGroup("ive", "IVE");

  const auto report = h.Build().Run(false);
  assert(report.outcomes[0].status == GroupStatus::kSkippedNoData);
  assert(h.sink->points.empty());
  assert(h.catalog->statistics_calls.empty());
}

void TestStatisticsFailureSkipsOnlyThatGroup() {
  Harness h({{"ive", GroupState{"A", 100, std::nullopt}}, {"aespa", GroupState{"W", 10, std::nullopt}}});
  h.AddGroup("ive", "IVE");
  h.AddGroup("aespa", "aespa");
  h.catalog->statistics_failures.insert("A");
  h.catalog->statistics["W"] = {20, ""};

  const auto report = h.Build().Run(false);

  assert(report.outcomes[0].status == GroupStatus::kSkippedNoData);
  assert(report.outcomes[1].status == GroupStatus::kUsedCache);
  assert((h.store->committed().at("ive") == GroupState{"A", 100, std::nullopt}));
  assert(h.store->committed().at("aespa").last_view == 20);
}

void TestQuotaOnThirdOfFiveGroupsAbortsButPersistsEarlierGroups() {
  Harness h({{"g3", GroupState{"V3", 300, std::nullopt}}});
  for (int i = 1; i <= 5; ++i) {
    h.AddGroup("g" + std::to_string(i), "G" + std::to_string(i));
  }
  h.catalog->statistics["V1"] = {11, ""};
  h.catalog->statistics["V2"] = {22, ""};
  h.catalog->statistics_quota.insert("V3");
  h.catalog->statistics["V4"] = {44, ""};
  h.catalog->statistics["V5"] = {55, ""};
  h.store->Save({{"g1", GroupState{"V1", 10, std::nullopt}},
                 {"g2", GroupState{"V2", 20, std::nullopt}},
                 {"g3", GroupState{"V3", 300, std::nullopt}},
                 {"g4", GroupState{"V4", 40, std::nullopt}},
                 {"g5", GroupState{"V5", 50, std::nullopt}}});

  const auto report = h.Build().Run(false);

  assert(report.aborted);
  assert(report.outcomes.size() == 3);
  assert(report.outcomes[2].status == GroupStatus::kAborted);

  // groups 4 and 5 were never touched
  assert((h.catalog->statistics_calls == std::vector<std::string>{"V1", "V2", "V3"}));
  assert(h.sink->points.size() == 4);

  const auto& committed = h.store->committed();
  assert(committed.at("g1").last_view == 11);
  assert(committed.at("g2").last_view == 22);
  assert(committed.at("g3").last_view == 300);
  assert(committed.at("g4").last_view == 40);
  assert(h.store->save_count() == 2);
}

void TestQuotaDuringSearchAbortsRun() {
  Harness h;
  h.AddGroup("ive", "IVE");
  h.AddGroup("aespa", "aespa");
  h.catalog->search_quota_keywords.insert("IVE");

  const auto report = h.Build().Run(true);

  assert(report.aborted);
  assert(report.outcomes.size() == 1);
  assert((h.catalog->search_calls == std::vector<std::string>{"IVE"}));
  assert(h.store->save_count() == 1);
}

void TestSinkFailureLeavesStateForNextRun() {
  Harness h({{"ive", GroupState{"A", 100, std::nullopt}}, {"aespa", GroupState{"W", 1, std::nullopt}}});
  h.AddGroup("ive", "IVE");
  h.AddGroup("aespa", "aespa");
  h.catalog->statistics["A"] = {180, ""};
  h.catalog->statistics["W"] = {2, ""};
  h.sink->reject_names.insert("kpop.youtube.viewdelta.ive_A");

  const auto report = h.Build().Run(false);

  assert(!report.aborted);
  assert(report.outcomes[0].status == GroupStatus::kSinkFailed);
  assert(report.outcomes[0].delta == 80);
  assert(report.outcomes[1].status == GroupStatus::kUsedCache);
  // baseline kept so the 80 views are reported again next run
  assert(h.store->committed().at("ive").last_view == 100);
}

void TestSaveEachGroupPersistsAfterEveryGroup() {
  Harness h({{"ive", GroupState{"A", 1, std::nullopt}}, {"aespa", GroupState{"W", 1, std::nullopt}}});
  h.settings.save_each_group = true;
  h.AddGroup("ive", "IVE");
  h.AddGroup("aespa", "aespa");
  h.catalog->statistics["A"] = {2, ""};
  h.catalog->statistics["W"] = {3, ""};

  (void)h.Build().Run(false);
  assert(h.store->save_count() == 3);
}

void TestUnexpectedExceptionPersistsBeforeRethrow() {
  Harness h({{"g1", GroupState{"V1", 10, std::nullopt}}, {"g2", GroupState{"V2", 20, std::nullopt}}});
  h.AddGroup("g1", "G1");
  h.AddGroup("g2", "G2");
  h.AddGroup("g3", "G3");
  h.catalog->statistics["V1"] = {15, ""};
  h.catalog->statistics["V2"] = {25, ""};
  h.sink->broken_names.insert("kpop.youtube.viewcount.g2_V2");

  bool threw = false;
  try {
    (void)h.Build().Run(false);
  } catch (const std::logic_error&) {
    threw = true;
  }

  assert(threw && "Unexpected errors must reach the caller.");
  assert(h.store->save_count() == 1);
  assert(h.store->committed().at("g1").last_view == 15);
  assert(h.store->committed().at("g2").last_view == 20);
}

} // namespace

int main() {
  TestSearchRunPostsAbsoluteAndDeltaForResolvedVideo();
  TestChangeoverStartsNewSeriesWithZeroDelta();
  TestCacheRunUsesStoredVideoWithoutSearching();
  TestSearchMissFallsBackToCache();
  TestSearchFailureFallsBackToCache();
  TestNoResolutionAndNoCacheSkipsGroup();
  TestCacheRunWithoutCacheSkipsGroup();
  TestStatisticsFailureSkipsOnlyThatGroup();
  TestQuotaOnThirdOfFiveGroupsAbortsButPersistsEarlierGroups();
  TestQuotaDuringSearchAbortsRun();
  TestSinkFailureLeavesStateForNextRun();
  TestSaveEachGroupPersistsAfterEveryGroup();
  TestUnexpectedExceptionPersistsBeforeRethrow();

  std::cout << "mvtracker_unit_run_orchestrator: pass\n";
  return 0;
}
