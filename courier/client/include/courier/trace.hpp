#pragma once

#include <memory>
#include <string_view>
#include <vector>

#include "courier/http-headers.hpp"
#include "courier/url.hpp"

namespace courier {

// Observer of the request / response exchange. All hooks are no-ops by default.
class Trace {
 public:
  virtual ~Trace() = default;

  // Called once the status line and headers have been serialized.
  virtual void onRequestHeadersSent([[maybe_unused]] std::string_view method, [[maybe_unused]] const Url& url,
                                    [[maybe_unused]] const http::Headers& headers) {}

  // Called for every body chunk, before compression and framing.
  virtual void onRequestChunkSent([[maybe_unused]] std::string_view method, [[maybe_unused]] const Url& url,
                                  [[maybe_unused]] std::string_view chunk) {}

  // Called with the whole body once it has been read.
  virtual void onResponseChunkReceived([[maybe_unused]] std::string_view method, [[maybe_unused]] const Url& url,
                                       [[maybe_unused]] std::string_view chunk) {}
};

using Traces = std::vector<std::shared_ptr<Trace>>;

}  // namespace courier
