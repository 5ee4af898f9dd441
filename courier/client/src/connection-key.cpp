#include "courier/connection-key.hpp"

#include <cstddef>
#include <functional>
#include <string_view>

#include "courier/ssl-policy.hpp"

namespace courier {

namespace {

void HashCombine(std::size_t& seed, std::size_t value) noexcept {
  seed ^= value + static_cast<std::size_t>(0x9e3779b97f4a7c15ULL) + (seed << 6) + (seed >> 2);
}

}  // namespace

std::size_t ConnectionKey::hash() const noexcept {
  std::size_t seed = std::hash<std::string_view>{}(host);
  HashCombine(seed, port ? static_cast<std::size_t>(*port) + 1U : 0U);
  HashCombine(seed, static_cast<std::size_t>(isSsl));
  HashCombine(seed, HashSslPolicy(ssl));
  if (proxy) {
    HashCombine(seed, std::hash<std::string_view>{}(proxy->scheme()));
    HashCombine(seed, std::hash<std::string_view>{}(proxy->rawHost()));
    HashCombine(seed, proxy->explicitPort().value_or(0));
  }
  HashCombine(seed, proxyAuth ? proxyAuth->hash() : 0U);
  HashCombine(seed, proxyHeadersHash.value_or(0U));
  return seed;
}

}  // namespace courier
