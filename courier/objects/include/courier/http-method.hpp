#pragma once

#include <string>
#include <string_view>

#include "courier/ascii.hpp"
#include "courier/http-constants.hpp"

namespace courier::http {

// Upper cased method.
// Throws MethodSyntaxError if 'method' is not a valid HTTP token.
[[nodiscard]] std::string NormalizeMethod(std::string_view method);

// Methods for which no body and no Transfer-Encoding negotiation is expected by default.
constexpr bool IsBodylessMethod(std::string_view method) noexcept {
  return method == GET || method == HEAD || method == OPTIONS || method == TRACE;
}

// Methods for which a default Content-Type is sent.
constexpr bool IsPostMethod(std::string_view method) noexcept {
  return method == PATCH || method == POST || method == PUT;
}

}  // namespace courier::http
