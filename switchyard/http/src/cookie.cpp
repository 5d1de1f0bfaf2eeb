#include "switchyard/cookie.hpp"

#include <string>
#include <string_view>
#include <vector>

#include "switchyard/string-trim.hpp"

namespace switchyard {

std::string Cookie::toSetCookieValue() const {
  std::string ret;
  ret.reserve(name.size() + value.size() + path.size() + domain.size() + 48U);
  ret.append(name).append(1, '=').append(value);
  if (!path.empty()) {
    ret.append("; Path=").append(path);
  }
  if (!domain.empty()) {
    ret.append("; Domain=").append(domain);
  }
  if (maxAge) {
    ret.append("; Max-Age=").append(std::to_string(maxAge->count()));
  }
  if (secure) {
    ret.append("; Secure");
  }
  if (httpOnly) {
    ret.append("; HttpOnly");
  }
  return ret;
}

void ParseCookieHeader(std::string_view headerValue, std::vector<Cookie>& out) {
  while (!headerValue.empty()) {
    const auto semiPos = headerValue.find(';');
    const std::string_view piece = TrimOws(headerValue.substr(0, semiPos));
    headerValue.remove_prefix(semiPos == std::string_view::npos ? headerValue.size() : semiPos + 1U);

    const auto eqPos = piece.find('=');
    if (eqPos == std::string_view::npos) {
      continue;
    }
    const std::string_view name = TrimOws(piece.substr(0, eqPos));
    std::string_view value = TrimOws(piece.substr(eqPos + 1U));
    if (name.empty()) {
      continue;
    }
    if (value.size() >= 2U && value.front() == '"' && value.back() == '"') {
      value = value.substr(1U, value.size() - 2U);
    }
    Cookie& cookie = out.emplace_back();
    cookie.name = name;
    cookie.value = value;
  }
}

}  // namespace switchyard
