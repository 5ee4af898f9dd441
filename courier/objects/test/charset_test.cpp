#include "courier/charset.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

namespace courier {

TEST(Charset, Lookup) {
  EXPECT_EQ(LookupCharset("UTF8"), "utf-8");
  EXPECT_EQ(LookupCharset("utf_8"), "utf-8");
  EXPECT_EQ(LookupCharset("Latin-1"), "iso8859-1");
  EXPECT_EQ(LookupCharset("ISO-8859-1"), "iso8859-1");
  EXPECT_EQ(LookupCharset("us-ascii"), "ascii");
  EXPECT_FALSE(LookupCharset("no-such-charset").has_value());
  EXPECT_FALSE(LookupCharset("").has_value());
}

TEST(Charset, DecodeLatin1) { EXPECT_EQ(DecodeToUtf8("caf\xE9", "latin-1"), "caf\xC3\xA9"); }

TEST(Charset, DecodeUtf8Validates) {
  EXPECT_EQ(DecodeToUtf8("caf\xC3\xA9", "utf-8"), "caf\xC3\xA9");
  EXPECT_THROW((void)DecodeToUtf8("a\xFF" "b", "utf-8"), std::invalid_argument);
  EXPECT_EQ(DecodeToUtf8("a\xFF" "b", "utf-8", DecodeErrors::Ignore), "ab");
  EXPECT_EQ(DecodeToUtf8("a\xFF" "b", "utf-8", DecodeErrors::Replace), "a\xEF\xBF\xBD" "b");
}

TEST(Charset, TruncatedSequence) {
  EXPECT_THROW((void)DecodeToUtf8("a\xC3", "utf-8"), std::invalid_argument);
  EXPECT_EQ(DecodeToUtf8("a\xC3", "utf-8", DecodeErrors::Ignore), "a");
}

TEST(Charset, UnknownCharsetThrows) {
  EXPECT_THROW((void)DecodeToUtf8("abc", "no-such-charset"), std::invalid_argument);
}

TEST(Charset, LargeInput) {
  const std::string input(10000, 'x');
  EXPECT_EQ(DecodeToUtf8(input, "ascii"), input);
}

}  // namespace courier
