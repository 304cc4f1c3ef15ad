#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace mvtracker::runtime::config {
class ResolverConfig;
}

namespace mvtracker::resolver {

/*
  Title heuristics for "official MV" detection.

  Each predicate is independent and works on the raw title; normalization
  (ASCII case folding, space removal, trimming) happens inside. The word
  lists are data so they can be overridden from configuration.
*/
struct TitleRules {
  std::vector<std::string> exclude_keywords;
  std::vector<std::string> accept_suffixes;
  std::string              relaxed_marker;

  static TitleRules Defaults();

  // Defaults with every non-empty list from the config replacing its
  // built-in counterpart. Entries are lower-cased.
  static TitleRules FromConfig(const mvtracker::runtime::config::ResolverConfig& config);

  // Group name without spaces, case folded, is a substring of the title
  // normalized the same way.
  static bool ContainsGroupName(std::string_view title, std::string_view group_name);

  bool HasExcludedKeyword(std::string_view title) const;

  // Trimmed, case-folded title ends with one of accept_suffixes.
  bool HasAcceptedSuffix(std::string_view title) const;

  bool MatchesPrimary(std::string_view title, std::string_view group_name) const;

  // Rescan rule after a short-form rejection: group name and the relaxed
  // marker anywhere in the title. Exclusion keywords are not applied.
  bool MatchesRelaxed(std::string_view title, std::string_view group_name) const;
};

} // namespace mvtracker::resolver
