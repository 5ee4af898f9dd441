#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "courier/basic-auth.hpp"
#include "courier/compression-config.hpp"
#include "courier/cookies.hpp"
#include "courier/http-headers.hpp"
#include "courier/http-version.hpp"
#include "courier/payload.hpp"
#include "courier/ssl-policy.hpp"
#include "courier/trace.hpp"
#include "courier/url.hpp"

namespace courier {

class ClientResponse;

// Plain value, or pre-encoded morsel sent with its coded value untouched.
using CookieValue = std::variant<std::string, Morsel>;
using RequestCookies = std::vector<std::pair<std::string, CookieValue>>;

// Fallback charset of a body whose Content-Type does not tell.
using CharsetResolver = std::function<std::string(const ClientResponse&, std::string_view body)>;

// Per request settings of a ClientRequest.
struct RequestOptions {
  // Appended to the query of the URL.
  Url::QueryParams params;
  http::Headers headers;
  // Names of the default headers (Accept, Accept-Encoding, User-Agent, payload Content-Type) not to send.
  std::vector<std::string> skipAutoHeaders;
  RequestBody data;
  RequestCookies cookies;
  std::optional<BasicAuth> auth;
  http::Version version{http::HTTP_1_1};
  // Content coding of the body ("deflate", "gzip", "br"). Empty selects deflate.
  std::optional<std::string> compress;
  std::optional<bool> chunked;
  bool expect100{false};
  std::optional<Url> proxy;
  std::optional<BasicAuth> proxyAuth;
  std::optional<http::Headers> proxyHeaders;
  SslPolicy ssl{true};
  Traces traces;
  // Look up credentials in the netrc file when no auth is given.
  bool trustEnv{false};
  std::optional<std::string> serverHostname;
  CharsetResolver charsetResolver;
  CompressionConfig compressionConfig;
};

}  // namespace courier
