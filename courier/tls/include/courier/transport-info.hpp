#pragma once

#include <openssl/ssl.h>

#include <cstdint>
#include <string>
#include <utility>

namespace courier {

struct PeerAddress {
  std::string host;
  uint16_t port{};

  bool operator==(const PeerAddress&) const noexcept = default;
};

// Introspection of an established transport, used after the handshake to validate pinned certificates.
class TransportInfo {
 public:
  virtual ~TransportInfo() = default;

  // True if the transport runs over TLS.
  [[nodiscard]] virtual bool tlsActive() const noexcept = 0;

  // DER encoding of the certificate presented by the peer, empty if there is none.
  [[nodiscard]] virtual std::string peerCertificateDer() const = 0;

  [[nodiscard]] virtual const PeerAddress& peerAddress() const noexcept = 0;
};

class PlainTransportInfo final : public TransportInfo {
 public:
  explicit PlainTransportInfo(PeerAddress peer) : _peer(std::move(peer)) {}

  [[nodiscard]] bool tlsActive() const noexcept override { return false; }

  [[nodiscard]] std::string peerCertificateDer() const override { return {}; }

  [[nodiscard]] const PeerAddress& peerAddress() const noexcept override { return _peer; }

 private:
  PeerAddress _peer;
};

// View over an OpenSSL connection. The SSL object is not owned and must outlive this object.
class SslTransportInfo final : public TransportInfo {
 public:
  SslTransportInfo(SSL* ssl, PeerAddress peer) noexcept : _ssl(ssl), _peer(std::move(peer)) {}

  [[nodiscard]] bool tlsActive() const noexcept override { return _ssl != nullptr; }

  // Throws std::runtime_error if the certificate cannot be encoded.
  [[nodiscard]] std::string peerCertificateDer() const override;

  [[nodiscard]] const PeerAddress& peerAddress() const noexcept override { return _peer; }

 private:
  SSL* _ssl;
  PeerAddress _peer;
};

}  // namespace courier
