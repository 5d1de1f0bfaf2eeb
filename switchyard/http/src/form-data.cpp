#include "switchyard/form-data.hpp"

#include <algorithm>
#include <optional>
#include <string_view>

#include "switchyard/http-error.hpp"
#include "switchyard/url-decode.hpp"

namespace switchyard {

FormData FormData::Parse(std::string_view body) {
  FormData formData;
  if (!url::DecodeFormUrlEncoded(body, formData._entries, true)) {
    throw FormParseError("Malformed form data");
  }
  return formData;
}

std::optional<std::string_view> FormData::value(std::string_view key) const noexcept {
  const auto it = std::ranges::find(_entries, key, &Entry::key);
  if (it == _entries.end()) {
    return std::nullopt;
  }
  return std::string_view(it->value);
}

}  // namespace switchyard
