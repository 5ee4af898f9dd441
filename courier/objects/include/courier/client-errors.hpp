#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "courier/http-headers.hpp"

namespace courier {

// Base of the errors raised by the client.
class ClientError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// URL without host, or with an unparsable authority.
class InvalidUrl : public ClientError {
 public:
  explicit InvalidUrl(std::string_view url);

  [[nodiscard]] const std::string& url() const noexcept { return _url; }

 private:
  std::string _url;
};

// Request method containing characters outside of the HTTP token alphabet.
class MethodSyntaxError : public std::invalid_argument {
 public:
  explicit MethodSyntaxError(std::string_view method);
};

// Mutually exclusive request settings (compress + Content-Encoding, chunked + Content-Length...).
class ConfigurationConflict : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

class FingerprintLengthError : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

class FingerprintInsecureAlgorithm : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

// Failure of the underlying connection.
class ClientConnectionError : public ClientError {
 public:
  using ClientError::ClientError;
};

// Read attempted on a released connection, or content failed because the response was released or closed.
class ConnectionClosedError : public ClientConnectionError {
 public:
  explicit ConnectionClosedError(const std::string& message = "Connection closed") : ClientConnectionError(message) {}
};

// OS level failure while writing the request body.
class ConnectionWriteError : public ClientConnectionError {
 public:
  ConnectionWriteError(std::error_code code, const std::string& message)
      : ClientConnectionError(message), _code(code) {}

  [[nodiscard]] std::error_code code() const noexcept { return _code; }

 private:
  std::error_code _code;
};

// Peer certificate digest differing from the pinned one.
class ServerFingerprintMismatch : public ClientConnectionError {
 public:
  ServerFingerprintMismatch(std::string expected, std::string got, std::string host, uint16_t port);

  [[nodiscard]] const std::string& expected() const noexcept { return _expected; }
  [[nodiscard]] const std::string& got() const noexcept { return _got; }
  [[nodiscard]] const std::string& host() const noexcept { return _host; }
  [[nodiscard]] uint16_t port() const noexcept { return _port; }

 private:
  std::string _expected;
  std::string _got;
  std::string _host;
  uint16_t _port;
};

// Error reported by the protocol layer while parsing a message head.
class HttpProcessingError : public std::runtime_error {
 public:
  HttpProcessingError(int code, const std::string& message, http::Headers headers = {})
      : std::runtime_error(message), _headers(std::move(headers)), _code(code) {}

  [[nodiscard]] int code() const noexcept { return _code; }
  [[nodiscard]] std::string_view message() const noexcept { return what(); }
  [[nodiscard]] const http::Headers& headers() const noexcept { return _headers; }

 private:
  http::Headers _headers;
  int _code;
};

// Malformed cookie string or attribute.
class CookieError : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

}  // namespace courier
