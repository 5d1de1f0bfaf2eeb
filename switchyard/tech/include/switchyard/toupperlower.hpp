#pragma once

namespace switchyard {

// Locale independent ASCII case conversions, usable in constant expressions.

constexpr unsigned char tolower(unsigned char ch) {
  if (ch >= 'A' && ch <= 'Z') {
    ch |= 0x20;
  }
  return ch;
}

constexpr char tolower(char ch) { return static_cast<char>(tolower(static_cast<unsigned char>(ch))); }

constexpr unsigned char toupper(unsigned char ch) {
  if (ch >= 'a' && ch <= 'z') {
    ch &= 0xDF;
  }
  return ch;
}

constexpr char toupper(char ch) { return static_cast<char>(toupper(static_cast<unsigned char>(ch))); }

}  // namespace switchyard
