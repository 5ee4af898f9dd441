#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "courier/client-errors.hpp"
#include "courier/http-headers.hpp"
#include "courier/request-info.hpp"

namespace courier {

class ClientResponse;

using ResponseHistory = std::vector<std::shared_ptr<const ClientResponse>>;

// Failure tied to a response: unparsable head, error status, unexpected content type.
class ResponseError : public ClientError {
 public:
  ResponseError(RequestInfo requestInfo, ResponseHistory history, int status, std::string message,
                http::Headers headers = {});

  [[nodiscard]] const RequestInfo& requestInfo() const noexcept { return _requestInfo; }
  [[nodiscard]] const ResponseHistory& history() const noexcept { return _history; }
  [[nodiscard]] int status() const noexcept { return _status; }
  [[nodiscard]] const std::string& message() const noexcept { return _message; }
  [[nodiscard]] const http::Headers& headers() const noexcept { return _headers; }

 private:
  RequestInfo _requestInfo;
  ResponseHistory _history;
  http::Headers _headers;
  std::string _message;
  int _status;
};

// Response media type differing from the expected one.
class ContentTypeMismatch : public ResponseError {
 public:
  using ResponseError::ResponseError;
};

}  // namespace courier
