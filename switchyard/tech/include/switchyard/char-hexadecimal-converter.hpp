#pragma once

namespace switchyard {

// Returns the value of the hexadecimal digit 'ch' (either case), or -1 if it is not a hex digit.
constexpr int from_hex_digit(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

// Writes the lower case hexadecimal representation of 'value' (without leading zeros, "0" for zero)
// to 'buf', which must hold at least 2 * sizeof(value) chars.
// Returns a pointer past the last written char.
template <class UInt>
constexpr char* to_lower_hex_number(UInt value, char* buf) {
  constexpr const char* kHexits = "0123456789abcdef";
  char tmp[2 * sizeof(UInt)];
  char* tmpEnd = tmp;
  do {
    *tmpEnd++ = kHexits[value & 0x0FU];
    value >>= 4U;
  } while (value != 0);
  while (tmpEnd != tmp) {
    *buf++ = *--tmpEnd;
  }
  return buf;
}

}  // namespace switchyard
