#pragma once

#include <string>
#include <string_view>

namespace mvtracker::util {

// ASCII case folding. Titles are compared byte-wise, so non-ASCII text
// (Hangul, kana) passes through unchanged.
std::string ToLower(std::string_view text);

std::string RemoveSpaces(std::string_view text);

std::string_view Trim(std::string_view text);

bool EndsWith(std::string_view text, std::string_view suffix);

} // namespace mvtracker::util
