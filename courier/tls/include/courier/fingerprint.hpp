#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "courier/transport-info.hpp"

namespace courier {

// Pinned digest of the server certificate. Only SHA-256 digests (32 bytes) are accepted.
class Fingerprint {
 public:
  static constexpr std::size_t kSha256Size = 32;

  // 'digest' holds raw digest bytes.
  // Throws FingerprintInsecureAlgorithm for MD5 or SHA-1 sized digests, FingerprintLengthError for other sizes.
  explicit Fingerprint(std::string digest);

  [[nodiscard]] const std::string& digest() const noexcept { return _digest; }

  // Compares the digest of the peer certificate with the pinned one. Does nothing for a non TLS transport.
  // Throws ServerFingerprintMismatch on inequality, including when the peer sent no certificate.
  void check(const TransportInfo& transport) const;

  bool operator==(const Fingerprint&) const noexcept = default;

 private:
  std::string _digest;
};

// Raw SHA-256 digest of 'data'.
[[nodiscard]] std::string Sha256Digest(std::string_view data);

}  // namespace courier
