#pragma once

#include <string>
#include <string_view>

namespace switchyard {

// Key under which a wildcard route (static mount or trailing '*') binds the remainder of the path.
inline constexpr std::string_view kWildcardParamKey = "*";

struct PathParamCapture {
  std::string key;
  std::string value;

  bool operator==(const PathParamCapture&) const = default;
};

}  // namespace switchyard
