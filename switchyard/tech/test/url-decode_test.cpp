#include "switchyard/url-decode.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

namespace switchyard::url {

namespace {

std::string Decode(std::string_view encoded, char plusAs = '+', bool strict = true) {
  std::string buf(encoded);
  char* end = DecodeInPlace(buf.data(), buf.data() + buf.size(), plusAs, strict);
  if (end == nullptr) {
    return "<invalid>";
  }
  buf.resize(static_cast<std::size_t>(end - buf.data()));
  return buf;
}

}  // namespace

TEST(UrlDecode, PlainStringUnchanged) { EXPECT_EQ(Decode("/hello/world"), "/hello/world"); }

TEST(UrlDecode, PercentSequences) {
  EXPECT_EQ(Decode("/hello%20world"), "/hello world");
  EXPECT_EQ(Decode("%2Fa%2fb"), "/a/b");
  EXPECT_EQ(Decode("caf%C3%A9"), "caf\xC3\xA9");
}

TEST(UrlDecode, PlusHandling) {
  EXPECT_EQ(Decode("a+b"), "a+b");
  EXPECT_EQ(Decode("a+b", ' '), "a b");
}

TEST(UrlDecode, StrictInvalid) {
  EXPECT_EQ(Decode("abc%"), "<invalid>");
  EXPECT_EQ(Decode("abc%2"), "<invalid>");
  EXPECT_EQ(Decode("abc%zz"), "<invalid>");
}

TEST(UrlDecode, LenientInvalidKeptLiterally) {
  EXPECT_EQ(Decode("abc%", '+', false), "abc%");
  EXPECT_EQ(Decode("a%zzb", '+', false), "a%zzb");
  EXPECT_EQ(Decode("100%25", '+', false), "100%");
}

TEST(FormUrlEncoded, DecodesPairsInOrder) {
  std::vector<DecodedPair> pairs;
  ASSERT_TRUE(DecodeFormUrlEncoded("name=Jane+Doe&city=New%20York&empty=&flag", pairs, true));
  ASSERT_EQ(pairs.size(), 4U);
  EXPECT_EQ(pairs[0], (DecodedPair{"name", "Jane Doe"}));
  EXPECT_EQ(pairs[1], (DecodedPair{"city", "New York"}));
  EXPECT_EQ(pairs[2], (DecodedPair{"empty", ""}));
  EXPECT_EQ(pairs[3], (DecodedPair{"flag", ""}));
}

TEST(FormUrlEncoded, SkipsEmptyPieces) {
  std::vector<DecodedPair> pairs;
  ASSERT_TRUE(DecodeFormUrlEncoded("&&a=1&&b=2&", pairs, true));
  ASSERT_EQ(pairs.size(), 2U);
  EXPECT_EQ(pairs[1].value, "2");
}

TEST(FormUrlEncoded, StrictRejectsInvalidEscapesAndEmptyKeys) {
  std::vector<DecodedPair> pairs;
  EXPECT_FALSE(DecodeFormUrlEncoded("a=%G1", pairs, true));
  pairs.clear();
  EXPECT_FALSE(DecodeFormUrlEncoded("=value", pairs, true));
}

TEST(FormUrlEncoded, LenientKeepsInvalidEscapes) {
  std::vector<DecodedPair> pairs;
  ASSERT_TRUE(DecodeFormUrlEncoded("q=100%&=x", pairs, false));
  ASSERT_EQ(pairs.size(), 2U);
  EXPECT_EQ(pairs[0].value, "100%");
  EXPECT_EQ(pairs[1].key, "");
}

}  // namespace switchyard::url
