#include "courier/http-version.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace courier::http {

TEST(HttpVersion, Parse) {
  EXPECT_EQ(ParseVersion("1.1"), HTTP_1_1);
  EXPECT_EQ(ParseVersion("HTTP/1.0"), HTTP_1_0);
  EXPECT_EQ(ParseVersion("0.9"), HTTP_0_9);
  EXPECT_EQ(ParseVersion("2.0"), (Version{2, 0}));
}

TEST(HttpVersion, ParseInvalid) {
  EXPECT_THROW((void)ParseVersion(""), std::invalid_argument);
  EXPECT_THROW((void)ParseVersion("1"), std::invalid_argument);
  EXPECT_THROW((void)ParseVersion("1."), std::invalid_argument);
  EXPECT_THROW((void)ParseVersion(".1"), std::invalid_argument);
  EXPECT_THROW((void)ParseVersion("a.b"), std::invalid_argument);
  EXPECT_THROW((void)ParseVersion("1.1x"), std::invalid_argument);
}

TEST(HttpVersion, OrderingAndStr) {
  EXPECT_LT(HTTP_0_9, HTTP_1_0);
  EXPECT_LT(HTTP_1_0, HTTP_1_1);
  EXPECT_EQ(HTTP_1_1.str(), "HTTP/1.1");
}

}  // namespace courier::http
