#include "courier/http-method.hpp"

#include <string>
#include <string_view>

#include "courier/ascii.hpp"
#include "courier/client-errors.hpp"

namespace courier::http {

std::string NormalizeMethod(std::string_view method) {
  if (!IsToken(method)) {
    throw MethodSyntaxError(method);
  }
  return ToUpper(method);
}

}  // namespace courier::http
