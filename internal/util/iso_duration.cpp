#include "iso_duration.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <string>

namespace mvtracker::util {

namespace {

// Reads "<digits>[.<digits>]" starting at pos. Returns false when no digits are present.
bool ReadNumber(std::string_view text, std::size_t& pos, double& value) {
  const std::size_t start    = pos;
  bool              digits   = false;
  bool              fraction = false;

  while (pos < text.size()) {
    const char c = text[pos];
    if (std::isdigit(static_cast<unsigned char>(c))) {
      digits = true;
    } else if ((c == '.' || c == ',') && !fraction) {
      fraction = true;
    } else {
      break;
    }
    ++pos;
  }

  if (!digits) {
    return false;
  }

  std::string number(text.substr(start, pos - start));
  for (auto& c : number) {
    if (c == ',') c = '.';
  }
  value = std::strtod(number.c_str(), nullptr);
  return true;
}

} // namespace

std::optional<std::chrono::seconds> ParseIsoDuration(std::string_view text) {
  if (text.size() < 3 || text[0] != 'P') {
    return std::nullopt;
  }

  double      total      = 0.0;
  bool        in_time    = false;
  bool        any_value  = false;
  bool        time_value = false;
  std::size_t pos        = 1;

  while (pos < text.size()) {
    if (text[pos] == 'T') {
      if (in_time) {
        return std::nullopt;
      }
      in_time = true;
      ++pos;
      continue;
    }

    double value = 0.0;
    if (!ReadNumber(text, pos, value) || pos >= text.size()) {
      return std::nullopt;
    }

    const char unit = text[pos++];
    if (!in_time) {
      switch (unit) {
        case 'W':
          total += value * 7 * 86400;
          break;
        case 'D':
          total += value * 86400;
          break;
        default:
          return std::nullopt;
      }
    } else {
      switch (unit) {
        case 'H':
          total += value * 3600;
          break;
        case 'M':
          total += value * 60;
          break;
        case 'S':
          total += value;
          break;
        default:
          return std::nullopt;
      }
      time_value = true;
    }
    any_value = true;
  }

  // "PT" with no time component is malformed.
  if (!any_value || (in_time && !time_value)) {
    return std::nullopt;
  }

  // 2^63, the first value that does not fit the representation
  if (!std::isfinite(total) || total >= 9223372036854775808.0) {
    return std::nullopt;
  }

  return std::chrono::seconds(static_cast<std::chrono::seconds::rep>(total));
}

} // namespace mvtracker::util
