#include "courier/client-errors.hpp"

#include <fmt/format.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace courier {

namespace {

std::string Hex(std::string_view digest) {
  std::string out;
  out.reserve(digest.size() * 2U);
  for (char ch : digest) {
    out.append(fmt::format("{:02x}", static_cast<unsigned char>(ch)));
  }
  return out;
}

}  // namespace

InvalidUrl::InvalidUrl(std::string_view url) : ClientError(std::string(url)), _url(url) {}

MethodSyntaxError::MethodSyntaxError(std::string_view method)
    : std::invalid_argument(fmt::format("Method cannot contain non-token characters '{}'", method)) {}

ServerFingerprintMismatch::ServerFingerprintMismatch(std::string expected, std::string got, std::string host,
                                                     uint16_t port)
    : ClientConnectionError(fmt::format("Server fingerprint mismatch for {}:{}, expected {}, got {}", host, port,
                                        Hex(expected), Hex(got))),
      _expected(std::move(expected)),
      _got(std::move(got)),
      _host(std::move(host)),
      _port(port) {}

}  // namespace courier
