#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "courier/basic-auth.hpp"
#include "courier/ssl-policy.hpp"
#include "courier/url.hpp"

namespace courier {

// Identity of the pool bucket a request may reuse connections from.
// Requests with equal keys can share a connection: same origin, same TLS policy, same proxy setup.
struct ConnectionKey {
  std::string host;
  std::optional<uint16_t> port;
  bool isSsl{false};
  SslPolicy ssl{true};
  std::optional<Url> proxy;
  std::optional<BasicAuth> proxyAuth;
  std::optional<std::size_t> proxyHeadersHash;

  [[nodiscard]] std::size_t hash() const noexcept;

  bool operator==(const ConnectionKey&) const noexcept = default;
};

}  // namespace courier

template <>
struct std::hash<courier::ConnectionKey> {
  std::size_t operator()(const courier::ConnectionKey& key) const noexcept { return key.hash(); }
};
