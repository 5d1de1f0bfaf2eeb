#pragma once

#include <string_view>
#include <vector>

namespace switchyard {

// Splits a path on '/', ignoring empty segments: "/", "" and "//" have no segments,
// "/hello//world/" has two ("hello", "world").
inline void SplitPathSegments(std::string_view path, std::vector<std::string_view>& out) {
  while (!path.empty()) {
    const auto slashPos = path.find('/');
    const std::string_view segment = path.substr(0, slashPos);
    if (!segment.empty()) {
      out.push_back(segment);
    }
    if (slashPos == std::string_view::npos) {
      break;
    }
    path.remove_prefix(slashPos + 1U);
  }
}

}  // namespace switchyard
