#pragma once

#include <openssl/ssl.h>

#include <cstddef>
#include <memory>
#include <variant>

#include "courier/fingerprint.hpp"

namespace courier {

using SslContextPtr = std::shared_ptr<SSL_CTX>;

// TLS verification settings of a request:
//  - true: default verification, false: no verification
//  - SslContextPtr: caller provided context, compared by identity
//  - Fingerprint: pinned certificate digest, compared by digest bytes
using SslPolicy = std::variant<bool, SslContextPtr, Fingerprint>;

// Shares ownership of 'ctx'. Throws std::bad_alloc if it is null.
[[nodiscard]] SslContextPtr MakeSharedSslContext(SSL_CTX* ctx);

// Pinned fingerprint of 'policy', or nullptr.
[[nodiscard]] inline const Fingerprint* PinnedFingerprint(const SslPolicy& policy) noexcept {
  return std::get_if<Fingerprint>(&policy);
}

[[nodiscard]] std::size_t HashSslPolicy(const SslPolicy& policy) noexcept;

}  // namespace courier
