#include "courier/base64.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <string_view>

namespace courier {

TEST(Base64, EncodeEmpty) { EXPECT_EQ(B64Encode(""), ""); }
TEST(Base64, Encode1) { EXPECT_EQ(B64Encode("f"), "Zg=="); }
TEST(Base64, Encode2) { EXPECT_EQ(B64Encode("fo"), "Zm8="); }
TEST(Base64, Encode3) { EXPECT_EQ(B64Encode("foo"), "Zm9v"); }
TEST(Base64, Encode6) { EXPECT_EQ(B64Encode("foobar"), "Zm9vYmFy"); }
TEST(Base64, EncodeCredentials) { EXPECT_EQ(B64Encode("Aladdin:open sesame"), "QWxhZGRpbjpvcGVuIHNlc2FtZQ=="); }

TEST(Base64, EncodeBinary) {
  const std::string bin{'\0', '\xff', '\x10'};
  EXPECT_EQ(B64Encode(bin), "AP8Q");
  EXPECT_EQ(B64Decode("AP8Q"), bin);
}

TEST(Base64, Decode) {
  EXPECT_EQ(B64Decode("Zm9vYmE="), "fooba");
  EXPECT_EQ(B64Decode("Zm9v YmFy"), "foobar");
  EXPECT_EQ(B64Decode("Zm9v\nYmFy"), "foobar");
  EXPECT_EQ(B64Decode(""), "");
}

TEST(Base64, DecodeInvalidCharacterThrows) {
  EXPECT_THROW((void)B64Decode("Zm9v*mFy"), std::invalid_argument);
  EXPECT_THROW((void)B64Decode(std::string_view("\xC3\xA9")), std::invalid_argument);
}

}  // namespace courier
