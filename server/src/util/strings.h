#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace walkplan {

// ASCII lower-casing. Non-ASCII bytes (Cyrillic catalog data) pass through.
std::string ToLowerAscii(std::string_view text);

std::string_view TrimWhitespace(std::string_view text);

// Splits on `separator`, trimming each piece and dropping empty ones.
std::vector<std::string> SplitAndTrim(std::string_view text, char separator);

bool ContainsAny(std::string_view haystack, const std::vector<std::string>& needles);

}  // namespace walkplan
