#include "courier/url-encode.hpp"

#include <gtest/gtest.h>

namespace courier::url {

TEST(UrlEncode, KeepsUnreserved) { EXPECT_EQ(Encode("AZaz09-._~"), "AZaz09-._~"); }

TEST(UrlEncode, EscapesReservedAndSpaces) {
  EXPECT_EQ(Encode("a b&c=d/e"), "a%20b%26c%3Dd%2Fe");
  EXPECT_EQ(Encode("a b", {}, true), "a+b");
  EXPECT_EQ(Encode("a/b", "/"), "a/b");
  EXPECT_EQ(Encode("\xC3\xA9"), "%C3%A9");
}

TEST(UrlEncode, Decode) {
  EXPECT_EQ(Decode("a%20b"), "a b");
  EXPECT_EQ(Decode("a+b"), "a+b");
  EXPECT_EQ(Decode("a+b", true), "a b");
  EXPECT_EQ(Decode("%C3%a9"), "\xC3\xA9");
}

TEST(UrlEncode, DecodeKeepsInvalidSequences) {
  EXPECT_EQ(Decode("100%"), "100%");
  EXPECT_EQ(Decode("%zz"), "%zz");
  EXPECT_EQ(Decode("%4"), "%4");
}

TEST(UrlEncode, Form) {
  EXPECT_EQ(EncodeForm({{"name", "John Doe"}, {"q", "a&b"}}), "name=John+Doe&q=a%26b");
  EXPECT_EQ(EncodeForm({}), "");
}

TEST(UrlEncode, Query) { EXPECT_EQ(EncodeQuery({{"path", "/a/b"}, {"x", "1 2"}}), "path=/a/b&x=1+2"); }

}  // namespace courier::url
