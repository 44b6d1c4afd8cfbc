#include "util/strings.h"

namespace walkplan {

std::string ToLowerAscii(std::string_view text) {
  std::string result(text);
  for (char& c : result) {
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
  }
  return result;
}

std::string_view TrimWhitespace(std::string_view text) {
  const char* kWhitespace = " \t\r\n";
  size_t begin = text.find_first_not_of(kWhitespace);
  if (begin == std::string_view::npos) {
    return {};
  }
  size_t end = text.find_last_not_of(kWhitespace);
  return text.substr(begin, end - begin + 1);
}

std::vector<std::string> SplitAndTrim(std::string_view text, char separator) {
  std::vector<std::string> pieces;
  size_t pos = 0;
  while (pos <= text.size()) {
    size_t next = text.find(separator, pos);
    if (next == std::string_view::npos) {
      next = text.size();
    }
    std::string_view piece = TrimWhitespace(text.substr(pos, next - pos));
    if (!piece.empty()) {
      pieces.emplace_back(piece);
    }
    pos = next + 1;
  }
  return pieces;
}

bool ContainsAny(
    std::string_view haystack, const std::vector<std::string>& needles
) {
  for (const std::string& needle : needles) {
    if (!needle.empty() && haystack.find(needle) != std::string_view::npos) {
      return true;
    }
  }
  return false;
}

}  // namespace walkplan
