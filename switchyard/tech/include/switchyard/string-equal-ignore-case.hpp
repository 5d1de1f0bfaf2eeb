#pragma once

#include <cstddef>
#include <string_view>

#include "switchyard/toupperlower.hpp"

namespace switchyard {

// Header names, cookie attributes and the Connection tokens are all compared ignoring ASCII case.
constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t pos = 0; pos < lhs.size(); ++pos) {
    if (tolower(lhs[pos]) != tolower(rhs[pos])) {
      return false;
    }
  }
  return true;
}

constexpr bool StartsWithCaseInsensitive(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() && CaseInsensitiveEqual(value.substr(0, prefix.size()), prefix);
}

struct CaseInsensitiveEqualFunc {
  constexpr bool operator()(std::string_view lhs, std::string_view rhs) const noexcept {
    return CaseInsensitiveEqual(lhs, rhs);
  }
};

}  // namespace switchyard
