#include "courier/transport-info.hpp"

#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <stdexcept>
#include <string>

#include "courier/tls-raii.hpp"

namespace courier {

std::string SslTransportInfo::peerCertificateDer() const {
  if (_ssl == nullptr) {
    return {};
  }
  X509Ptr cert = AdoptX509(::SSL_get1_peer_certificate(_ssl));
  if (!cert) {
    return {};
  }
  const int len = ::i2d_X509(cert.get(), nullptr);
  if (len <= 0) {
    throw std::runtime_error("Unable to DER encode the peer certificate");
  }
  std::string der(static_cast<std::string::size_type>(len), '\0');
  auto* out = reinterpret_cast<unsigned char*>(der.data());
  if (::i2d_X509(cert.get(), &out) != len) {
    throw std::runtime_error("Unable to DER encode the peer certificate");
  }
  return der;
}

}  // namespace courier
