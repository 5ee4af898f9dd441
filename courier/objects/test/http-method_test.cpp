#include "courier/http-method.hpp"

#include <gtest/gtest.h>

#include "courier/client-errors.hpp"

namespace courier::http {

TEST(HttpMethod, NormalizeUpperCases) {
  EXPECT_EQ(NormalizeMethod("get"), "GET");
  EXPECT_EQ(NormalizeMethod("Patch"), "PATCH");
  EXPECT_EQ(NormalizeMethod("X-CUSTOM!"), "X-CUSTOM!");
}

TEST(HttpMethod, NonTokenCharactersThrow) {
  EXPECT_THROW((void)NormalizeMethod("GET /"), MethodSyntaxError);
  EXPECT_THROW((void)NormalizeMethod("GE\r\nT"), MethodSyntaxError);
  EXPECT_THROW((void)NormalizeMethod(""), MethodSyntaxError);
  EXPECT_THROW((void)NormalizeMethod("G(ET)"), MethodSyntaxError);
}

TEST(HttpMethod, Categories) {
  EXPECT_TRUE(IsBodylessMethod(GET));
  EXPECT_TRUE(IsBodylessMethod(TRACE));
  EXPECT_FALSE(IsBodylessMethod(POST));
  EXPECT_FALSE(IsBodylessMethod(DELETE));
  EXPECT_TRUE(IsPostMethod(PUT));
  EXPECT_FALSE(IsPostMethod(GET));
}

}  // namespace courier::http
