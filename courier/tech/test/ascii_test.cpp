#include "courier/ascii.hpp"

#include <gtest/gtest.h>

#include <string_view>

namespace courier {

TEST(Ascii, ToLowerUpper) {
  EXPECT_EQ(tolower('A'), 'a');
  EXPECT_EQ(tolower('z'), 'z');
  EXPECT_EQ(tolower('1'), '1');
  EXPECT_EQ(toupper('q'), 'Q');
  EXPECT_EQ(ToLower("Content-Type"), "content-type");
  EXPECT_EQ(ToUpper("patch"), "PATCH");
}

TEST(Ascii, Tchars) {
  for (char ch : std::string_view("!#$%&'*+-.^_`|~09azAZ")) {
    EXPECT_TRUE(IsTchar(ch)) << ch;
  }
  for (char ch : std::string_view(" \t\r\n\"(),/:;<=>?@[\\]{}")) {
    EXPECT_FALSE(IsTchar(ch)) << ch;
  }
  EXPECT_FALSE(IsTchar(static_cast<char>(0xC3)));
  EXPECT_TRUE(IsToken("GET"));
  EXPECT_TRUE(IsToken("M-SEARCH"));
  EXPECT_FALSE(IsToken(""));
  EXPECT_FALSE(IsToken("GET /"));
}

TEST(Ascii, CaseInsensitiveEqual) {
  EXPECT_TRUE(CaseInsensitiveEqual("hello", "HELLO"));
  EXPECT_TRUE(CaseInsensitiveEqual("", ""));
  EXPECT_FALSE(CaseInsensitiveEqual("HELLO", "hell"));
  EXPECT_FALSE(CaseInsensitiveEqual("hello", "world"));
}

TEST(Ascii, CaseInsensitiveLess) {
  EXPECT_FALSE(CaseInsensitiveLess("abc", "ABC"));
  EXPECT_TRUE(CaseInsensitiveLess("abc", "ABcD"));
  EXPECT_FALSE(CaseInsensitiveLess("abcd", "abc"));
}

TEST(Ascii, StartsWithAndContains) {
  EXPECT_TRUE(StartsWithCaseInsensitive("Application/JSON", "application/"));
  EXPECT_FALSE(StartsWithCaseInsensitive("app", "application"));
  EXPECT_TRUE(ContainsCaseInsensitive("gzip, Chunked", "chunked"));
  EXPECT_FALSE(ContainsCaseInsensitive("gzip", "chunked"));
  EXPECT_TRUE(ContainsCaseInsensitive("x", ""));
}

TEST(Ascii, CaseInsensitiveHash) {
  CaseInsensitiveHashFunc hash;
  EXPECT_EQ(hash("Content-Length"), hash("content-length"));
  EXPECT_NE(hash("Content-Length"), hash("Content-Type"));
}

TEST(Ascii, TrimOws) {
  EXPECT_EQ(TrimOws(" \t value\t "), "value");
  EXPECT_EQ(TrimOws("   "), "");
  EXPECT_EQ(TrimOws("a b"), "a b");
}

}  // namespace courier
