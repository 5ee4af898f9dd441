#pragma once

#include <openssl/ssl.h>

#include <cstdint>
#include <string>
#include <utility>

#include "courier/tls-raii.hpp"

namespace courier::test {

enum class KeyAlgorithm : uint8_t { Rsa2048, EcdsaP256 };

// Generates an ephemeral self-signed certificate in memory. Returns {certPem, keyPem}.
// Throws std::runtime_error on failure.
std::pair<std::string, std::string> MakeEphemeralCertKey(const char* commonName = "localhost", int validSeconds = 3600,
                                                         KeyAlgorithm alg = KeyAlgorithm::EcdsaP256);

// DER encoding of a PEM certificate.
std::string PemCertificateToDer(const std::string& certPem);

// Client and server TLS endpoints connected through an in-memory BIO pair, with the handshake completed.
// The client does not verify the server certificate.
class TlsLoopback {
 public:
  // Throws std::runtime_error if the handshake fails.
  explicit TlsLoopback(const char* commonName = "localhost");

  [[nodiscard]] SSL* clientSsl() const noexcept { return _client.get(); }

  [[nodiscard]] const std::string& serverCertificateDer() const noexcept { return _certDer; }

 private:
  SslCtxPtr _serverCtx;
  SslCtxPtr _clientCtx;
  SslPtr _server;
  SslPtr _client;
  std::string _certDer;
};

}  // namespace courier::test
