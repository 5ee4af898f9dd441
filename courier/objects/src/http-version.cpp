#include "courier/http-version.hpp"

#include <fmt/format.h>

#include <charconv>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace courier::http {

namespace {
constexpr std::string_view kHttpPrefix = "HTTP/";
}  // namespace

std::string Version::str() const { return fmt::format("{}{}.{}", kHttpPrefix, major, minor); }

Version ParseVersion(std::string_view str) {
  std::string_view digits = str;
  if (digits.starts_with(kHttpPrefix)) {
    digits.remove_prefix(kHttpPrefix.size());
  }

  const auto dot = digits.find('.');
  if (dot == std::string_view::npos || dot == 0 || dot + 1 == digits.size()) {
    throw std::invalid_argument(fmt::format("Can not parse http version number: {}", str));
  }

  Version ret;
  const char* last = digits.data() + digits.size();
  const auto [majorEnd, majorEc] = std::from_chars(digits.data(), digits.data() + dot, ret.major);
  const auto [minorEnd, minorEc] = std::from_chars(digits.data() + dot + 1, last, ret.minor);
  if (majorEc != std::errc() || minorEc != std::errc() || majorEnd != digits.data() + dot || minorEnd != last) {
    throw std::invalid_argument(fmt::format("Can not parse http version number: {}", str));
  }
  return ret;
}

}  // namespace courier::http
