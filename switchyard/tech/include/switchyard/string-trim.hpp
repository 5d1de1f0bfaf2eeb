#pragma once

#include <string_view>

namespace switchyard {

// Trims optional whitespace (SP and HTAB) on both sides, as found around header values and cookie pairs.
constexpr std::string_view TrimOws(std::string_view sv) noexcept {
  const auto first = sv.find_first_not_of(" \t");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = sv.find_last_not_of(" \t");
  return sv.substr(first, last - first + 1U);
}

}  // namespace switchyard
