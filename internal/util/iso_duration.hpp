#pragma once

#include <chrono>
#include <optional>
#include <string_view>

namespace mvtracker::util {

/*
  Parses the ISO-8601 duration subset used by video catalogs:

    P[nW][nD][T[nH][nM][nS]]

  Components may carry a decimal fraction; the result is truncated to whole
  seconds. Calendar units (years, months) have no fixed length and are
  rejected, as is any malformed input.
*/
std::optional<std::chrono::seconds> ParseIsoDuration(std::string_view text);

} // namespace mvtracker::util
