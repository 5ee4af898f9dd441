#pragma once

#include <string>

#include "courier/http-headers.hpp"
#include "courier/url.hpp"

namespace courier {

// Snapshot of a request, kept by its response and by the errors it raises.
struct RequestInfo {
  Url url;
  std::string method;
  http::Headers headers;
  // Url including the fragment, as given by the caller.
  Url realUrl;

  bool operator==(const RequestInfo&) const noexcept = default;
};

}  // namespace courier
