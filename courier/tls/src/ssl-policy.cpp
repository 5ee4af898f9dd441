#include "courier/ssl-policy.hpp"

#include <openssl/ssl.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <new>
#include <string>
#include <variant>

namespace courier {

SslContextPtr MakeSharedSslContext(SSL_CTX* ctx) {
  if (ctx == nullptr) {
    throw std::bad_alloc();
  }
  return {ctx, ::SSL_CTX_free};
}

std::size_t HashSslPolicy(const SslPolicy& policy) noexcept {
  const std::size_t index = policy.index();
  std::size_t hash = 0;
  if (const auto* verify = std::get_if<bool>(&policy)) {
    hash = std::hash<bool>{}(*verify);
  } else if (const auto* ctx = std::get_if<SslContextPtr>(&policy)) {
    hash = std::hash<const SSL_CTX*>{}(ctx->get());
  } else if (const auto* fingerprint = std::get_if<Fingerprint>(&policy)) {
    hash = std::hash<std::string>{}(fingerprint->digest());
  }
  return hash ^ (index + 0x9e3779b97f4a7c15ULL + (hash << 6) + (hash >> 2));
}

}  // namespace courier
