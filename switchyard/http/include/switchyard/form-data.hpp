#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "switchyard/url-decode.hpp"

namespace switchyard {

// Decoded application/x-www-form-urlencoded body. Keys may repeat, order is preserved.
class FormData {
 public:
  using Entry = url::DecodedPair;

  FormData() noexcept = default;

  // Throws FormParseError on invalid percent encoding or empty key.
  static FormData Parse(std::string_view body);

  // First value for 'key', if any.
  [[nodiscard]] std::optional<std::string_view> value(std::string_view key) const noexcept;

  [[nodiscard]] std::span<const Entry> entries() const noexcept { return _entries; }

  [[nodiscard]] std::size_t size() const noexcept { return _entries.size(); }

  [[nodiscard]] bool empty() const noexcept { return _entries.empty(); }

 private:
  std::vector<Entry> _entries;
};

}  // namespace switchyard
