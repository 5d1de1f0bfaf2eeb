#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace switchyard::url {

// Decodes percent-encoded sequences in place within [first, last), optionally translating '+' into 'plusAs'
// (only form and query values should map '+' to a space, never paths).
// Returns the new logical end of the decoded sequence, or nullptr on invalid encoding (truncated '%' or
// non hexadecimal digits) when strictInvalid is true. In that case the buffer content is unspecified.
// With strictInvalid false, invalid sequences are kept literally.
char* DecodeInPlace(char* first, char* last, char plusAs = '+', bool strictInvalid = true);

struct DecodedPair {
  std::string key;
  std::string value;

  bool operator==(const DecodedPair&) const = default;
};

// Splits an application/x-www-form-urlencoded sequence ("a=1&b=two+words") into decoded pairs, in order.
// Empty pieces ("a=1&&b=2") are skipped, a piece without '=' has an empty value.
// In strict mode, returns false on the first invalid percent encoding or empty key, leaving 'out' partially
// filled. In lenient mode, invalid escapes are kept literally and the function always returns true.
bool DecodeFormUrlEncoded(std::string_view encoded, std::vector<DecodedPair>& out, bool strict);

}  // namespace switchyard::url
