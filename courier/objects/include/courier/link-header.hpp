#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "courier/url.hpp"

namespace courier::http {

struct Link {
  // Value of the 'rel' parameter, or the raw target when there is none.
  std::string key;
  std::vector<std::pair<std::string, std::string>> params;
  // Target resolved against the URL of the response.
  Url url;
};

// Parses the values of the Link headers of a response (RFC 8288), in order.
[[nodiscard]] std::vector<Link> ParseLinks(const std::vector<std::string_view>& values, const Url& baseUrl);

}  // namespace courier::http
