#include "courier/client-errors.hpp"

#include <gtest/gtest.h>

#include <string>
#include <system_error>

namespace courier {

TEST(ClientErrors, Hierarchy) {
  EXPECT_THROW(throw ConnectionClosedError(), ClientConnectionError);
  EXPECT_THROW(throw ConnectionWriteError(std::make_error_code(std::errc::broken_pipe), "w"), ClientError);
  EXPECT_THROW(throw ServerFingerprintMismatch("a", "b", "h", 1), ClientConnectionError);
  EXPECT_THROW(throw InvalidUrl("x"), ClientError);
  EXPECT_THROW(throw MethodSyntaxError("A B"), std::invalid_argument);
  EXPECT_THROW(throw ConfigurationConflict("c"), std::invalid_argument);
}

TEST(ClientErrors, Messages) {
  EXPECT_STREQ(ConnectionClosedError().what(), "Connection closed");
  EXPECT_STREQ(MethodSyntaxError("A B").what(), "Method cannot contain non-token characters 'A B'");
  EXPECT_EQ(InvalidUrl("/path").url(), "/path");

  ServerFingerprintMismatch mismatch(std::string("\x01\xab", 2), std::string("\xff", 1), "example.com", 443);
  EXPECT_EQ(mismatch.host(), "example.com");
  EXPECT_EQ(mismatch.port(), 443);
  EXPECT_EQ(std::string(mismatch.what()), "Server fingerprint mismatch for example.com:443, expected 01ab, got ff");
}

TEST(ClientErrors, WriteErrorKeepsCode) {
  ConnectionWriteError err(std::make_error_code(std::errc::connection_reset), "Can not write request body for x");
  EXPECT_EQ(err.code(), std::make_error_code(std::errc::connection_reset));
}

TEST(ClientErrors, HttpProcessingError) {
  HttpProcessingError err(400, "bad status line", http::Headers{{"X-A", "1"}});
  EXPECT_EQ(err.code(), 400);
  EXPECT_EQ(err.message(), "bad status line");
  EXPECT_EQ(err.headers().get("x-a"), "1");
}

}  // namespace courier
