#include "internal/resolver/title_rules.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "config/config.pb.h"

namespace {

using mvtracker::resolver::TitleRules;

void TestGroupNameMatchIgnoresSpacesAndCase() {
  assert(TitleRules::ContainsGroupName("LE SSERAFIM (르세라핌) 'HOT' OFFICIAL MV", "LE SSERAFIM"));
  assert(TitleRules::ContainsGroupName("LESSERAFIM 'HOT' MV", "LE SSERAFIM"));
  assert(TitleRules::ContainsGroupName("le sserafim 'HOT' MV", "LE SSERAFIM"));
  assert(TitleRules::ContainsGroupName("TAEYEON 태연 'Panorama' MV", "TAEYEON Panorama") == false);
}

void TestTitlesWithoutGroupNameAreRejected() {
  const auto rules = TitleRules::Defaults();
  for (const std::string title : {"NMIXX 'DASH' MV", "KISS OF LIFE 'Sticky' Official MV", "Official MV", ""}) {
    assert(!rules.MatchesPrimary(title, "IVE"));
  }
}

void TestEveryExclusionKeywordRejects() {
  const auto rules = TitleRules::Defaults();
  for (const std::string keyword :
       {"Remix", "PERFORMANCE", "Perf.", "dance", "Choreo", "Practice", "Teaser", "Highlight", "Lyric", "Reaction", "Track Video"}) {
    const std::string title = "IVE 'REBEL HEART' " + keyword + " MV";
    assert(rules.HasExcludedKeyword(title));
    assert(!rules.MatchesPrimary(title, "IVE"));
  }
}

void TestAcceptedSuffixes() {
  const auto rules = TitleRules::Defaults();
  assert(rules.HasAcceptedSuffix("aespa 에스파 'Whiplash' MV"));
  assert(rules.HasAcceptedSuffix("aespa 'Whiplash' (Official MV)"));
  assert(rules.HasAcceptedSuffix("[MV] aespa 'Whiplash' [MV]"));
  assert(rules.HasAcceptedSuffix("aespa 'Whiplash' Official mv   "));
  assert(!rules.HasAcceptedSuffix("aespa 'Whiplash' MV Behind"));
  assert(!rules.HasAcceptedSuffix("[MV] aespa 'Whiplash'"));
}

void TestOfficialMvTitleQualifiesButDancePracticeDoesNot() {
  const auto rules = TitleRules::Defaults();
  assert(rules.MatchesPrimary("IVE 아이브 'ATTITUDE' Official MV", "IVE"));
  assert(rules.MatchesPrimary("IVE 아이브 'ATTITUDE' OFFICIAL mv", "IVE"));
  assert(!rules.MatchesPrimary("IVE 아이브 'ATTITUDE' Official MV (Dance Practice)", "IVE"));
}

void TestRelaxedRuleIgnoresExclusionsAndSuffix() {
  const auto rules = TitleRules::Defaults();
  assert(rules.MatchesRelaxed("ILLIT 'Magnetic' MV Teaser", "ILLIT"));
  assert(rules.MatchesRelaxed("[MV] ILLIT (아일릿) 'Magnetic'", "ILLIT"));
  assert(!rules.MatchesRelaxed("ILLIT 'Magnetic' Official Audio", "ILLIT"));
  assert(!rules.MatchesRelaxed("NewJeans 'Supernatural' MV", "ILLIT"));
}

void TestConfigOverridesReplaceLists() {
  mvtracker::runtime::config::ResolverConfig config;
  config.add_exclude_keywords("Behind");
  config.add_accept_suffixes("M/V");
  config.set_relaxed_marker("M/V");

  const auto rules = TitleRules::FromConfig(config);
  assert(rules.exclude_keywords.size() == 1 && rules.exclude_keywords[0] == "behind");
  assert(rules.MatchesPrimary("IVE 'I AM' M/V", "IVE"));
  assert(!rules.MatchesPrimary("IVE 'I AM' Behind M/V", "IVE"));
  // dance is no longer excluded once the list is replaced
  assert(rules.MatchesPrimary("IVE 'I AM' Dance M/V", "IVE"));
  assert(rules.MatchesRelaxed("IVE 'I AM' m/v teaser", "IVE"));
}

void TestEmptyConfigKeepsDefaults() {
  mvtracker::runtime::config::ResolverConfig config;
  const auto rules = TitleRules::FromConfig(config);
  assert(rules.exclude_keywords == TitleRules::Defaults().exclude_keywords);
  assert(rules.accept_suffixes == TitleRules::Defaults().accept_suffixes);
  assert(rules.relaxed_marker == "mv");
}

} // namespace

int main() {
  TestGroupNameMatchIgnoresSpacesAndCase();
  TestTitlesWithoutGroupNameAreRejected();
  TestEveryExclusionKeywordRejects();
  TestAcceptedSuffixes();
  TestOfficialMvTitleQualifiesButDancePracticeDoesNot();
  TestRelaxedRuleIgnoresExclusionsAndSuffix();
  TestConfigOverridesReplaceLists();
  TestEmptyConfigKeepsDefaults();

  std::cout << "mvtracker_unit_title_rules: pass\n";
  return 0;
}
