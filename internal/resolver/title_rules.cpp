#include "title_rules.hpp"

#include "config/config.pb.h"
#include "internal/util/text.hpp"

namespace mvtracker::resolver {

using mvtracker::util::EndsWith;
using mvtracker::util::RemoveSpaces;
using mvtracker::util::ToLower;
using mvtracker::util::Trim;

TitleRules TitleRules::Defaults() {
  TitleRules rules;
  rules.exclude_keywords = {
      "remix", "performance", "perf.", "dance", "choreo", "practice", "teaser", "highlight", "lyric", "reaction", "track video",
  };
  rules.accept_suffixes = {"mv", "mv)", "mv]", "official mv"};
  rules.relaxed_marker  = "mv";
  return rules;
}

TitleRules TitleRules::FromConfig(const mvtracker::runtime::config::ResolverConfig& config) {
  auto rules = Defaults();

  if (!config.exclude_keywords().empty()) {
    rules.exclude_keywords.clear();
    for (const auto& keyword : config.exclude_keywords()) rules.exclude_keywords.push_back(ToLower(keyword));
  }
  if (!config.accept_suffixes().empty()) {
    rules.accept_suffixes.clear();
    for (const auto& suffix : config.accept_suffixes()) rules.accept_suffixes.push_back(ToLower(suffix));
  }
  if (!config.relaxed_marker().empty()) {
    rules.relaxed_marker = ToLower(config.relaxed_marker());
  }
  return rules;
}

bool TitleRules::ContainsGroupName(std::string_view title, std::string_view group_name) {
  const auto key = RemoveSpaces(ToLower(group_name));
  return RemoveSpaces(ToLower(title)).find(key) != std::string::npos;
}

bool TitleRules::HasExcludedKeyword(std::string_view title) const {
  const auto lower = ToLower(title);
  for (const auto& keyword : exclude_keywords) {
    if (lower.find(keyword) != std::string::npos) {
      return true;
    }
  }
  return false;
}

bool TitleRules::HasAcceptedSuffix(std::string_view title) const {
  const auto lower   = ToLower(title);
  const auto trimmed = Trim(lower);
  for (const auto& suffix : accept_suffixes) {
    if (EndsWith(trimmed, suffix)) {
      return true;
    }
  }
  return false;
}

bool TitleRules::MatchesPrimary(std::string_view title, std::string_view group_name) const {
  return ContainsGroupName(title, group_name) && !HasExcludedKeyword(title) && HasAcceptedSuffix(title);
}

bool TitleRules::MatchesRelaxed(std::string_view title, std::string_view group_name) const {
  return ContainsGroupName(title, group_name) && ToLower(title).find(relaxed_marker) != std::string::npos;
}

} // namespace mvtracker::resolver
