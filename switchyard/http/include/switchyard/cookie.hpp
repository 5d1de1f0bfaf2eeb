#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace switchyard {

struct Cookie {
  std::string name;
  std::string value;

  // Optional attributes, only used when the cookie is sent back in a Set-Cookie header.
  std::string path;
  std::string domain;
  std::optional<std::chrono::seconds> maxAge;
  bool httpOnly{false};
  bool secure{false};

  // Value of a Set-Cookie header for this cookie, for instance "session=abc; Path=/; HttpOnly".
  [[nodiscard]] std::string toSetCookieValue() const;

  bool operator==(const Cookie&) const = default;
};

// Parses the value of a request Cookie header ("a=1; b=2") into name / value pairs, in order.
// Pieces without '=' or with an empty name are skipped. Surrounding double quotes of values are removed.
void ParseCookieHeader(std::string_view headerValue, std::vector<Cookie>& out);

}  // namespace switchyard
