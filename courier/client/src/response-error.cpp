#include "courier/response-error.hpp"

#include <string>
#include <utility>

#include <fmt/format.h>

#include "courier/client-errors.hpp"
#include "courier/http-headers.hpp"
#include "courier/request-info.hpp"

namespace courier {

ResponseError::ResponseError(RequestInfo requestInfo, ResponseHistory history, int status, std::string message,
                             http::Headers headers)
    : ClientError(fmt::format("{}, message='{}', url='{}'", status, message, requestInfo.realUrl.toString())),
      _requestInfo(std::move(requestInfo)),
      _history(std::move(history)),
      _headers(std::move(headers)),
      _message(std::move(message)),
      _status(status) {}

}  // namespace courier
