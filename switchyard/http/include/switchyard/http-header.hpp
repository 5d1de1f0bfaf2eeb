#pragma once

#include <string>
#include <string_view>

namespace switchyard {

struct HttpHeader {
  std::string name;
  std::string value;

  bool operator==(const HttpHeader&) const = default;
};

namespace http {

// Header names are RFC 9110 tokens.
constexpr bool IsValidHeaderName(std::string_view name) noexcept {
  if (name.empty()) {
    return false;
  }
  for (const char ch : name) {
    const bool alnum = (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
    if (!alnum && std::string_view("!#$%&'*+-.^_`|~").find(ch) == std::string_view::npos) {
      return false;
    }
  }
  return true;
}

// Header values may not contain control characters other than horizontal tab, CR and LF in particular.
constexpr bool IsValidHeaderValue(std::string_view value) noexcept {
  for (const char ch : value) {
    const auto uch = static_cast<unsigned char>(ch);
    if ((uch < 0x20 && ch != '\t') || uch == 0x7F) {
      return false;
    }
  }
  return true;
}

}  // namespace http

}  // namespace switchyard
