#include "switchyard/url-decode.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "switchyard/char-hexadecimal-converter.hpp"

namespace switchyard::url {

char* DecodeInPlace(char* first, char* last, char plusAs, bool strictInvalid) {
  char* out = first;
  for (; first < last; ++first) {
    const char ch = *first;
    if (ch == '+') {
      *out++ = plusAs;
      continue;
    }
    if (ch != '%') {
      *out++ = ch;
      continue;
    }
    if (last - first < 3) {
      if (strictInvalid) {
        return nullptr;
      }
      *out++ = '%';
      continue;
    }
    const int hi = from_hex_digit(first[1]);
    const int lo = from_hex_digit(first[2]);
    if (hi < 0 || lo < 0) {
      if (strictInvalid) {
        return nullptr;
      }
      *out++ = '%';
      continue;
    }
    *out++ = static_cast<char>((hi << 4) | lo);
    first += 2;
  }
  return out;
}

namespace {

bool DecodeComponent(std::string_view encoded, std::string& out, bool strict) {
  out.assign(encoded);
  char* newEnd = DecodeInPlace(out.data(), out.data() + out.size(), ' ', strict);
  if (newEnd == nullptr) {
    return false;
  }
  out.resize(static_cast<std::size_t>(newEnd - out.data()));
  return true;
}

}  // namespace

bool DecodeFormUrlEncoded(std::string_view encoded, std::vector<DecodedPair>& out, bool strict) {
  while (!encoded.empty()) {
    const auto ampPos = encoded.find('&');
    const std::string_view piece = encoded.substr(0, ampPos);
    encoded.remove_prefix(ampPos == std::string_view::npos ? encoded.size() : ampPos + 1U);
    if (piece.empty()) {
      continue;
    }
    const auto eqPos = piece.find('=');
    const std::string_view rawKey = piece.substr(0, eqPos);
    const std::string_view rawValue = eqPos == std::string_view::npos ? std::string_view{} : piece.substr(eqPos + 1U);

    DecodedPair& pair = out.emplace_back();
    if (!DecodeComponent(rawKey, pair.key, strict) || !DecodeComponent(rawValue, pair.value, strict)) {
      return false;
    }
    if (strict && pair.key.empty()) {
      return false;
    }
  }
  return true;
}

}  // namespace switchyard::url
