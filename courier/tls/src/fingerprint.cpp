#include "courier/fingerprint.hpp"

#include <openssl/evp.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "courier/client-errors.hpp"
#include "courier/tls-raii.hpp"
#include "courier/transport-info.hpp"

namespace courier {

namespace {

constexpr std::size_t kMd5Size = 16;
constexpr std::size_t kSha1Size = 20;

}  // namespace

Fingerprint::Fingerprint(std::string digest) : _digest(std::move(digest)) {
  const auto size = _digest.size();
  if (size == kMd5Size || size == kSha1Size) {
    throw FingerprintInsecureAlgorithm("md5 and sha1 are insecure and not supported. Use sha256.");
  }
  if (size != kSha256Size) {
    throw FingerprintLengthError("fingerprint has invalid length");
  }
}

void Fingerprint::check(const TransportInfo& transport) const {
  if (!transport.tlsActive()) {
    return;
  }
  const std::string der = transport.peerCertificateDer();
  std::string got = der.empty() ? std::string() : Sha256Digest(der);
  if (got != _digest) {
    const auto& peer = transport.peerAddress();
    throw ServerFingerprintMismatch(_digest, std::move(got), peer.host, peer.port);
  }
}

std::string Sha256Digest(std::string_view data) {
  MdCtxPtr ctx = MakeMdCtx();
  std::string digest(EVP_MAX_MD_SIZE, '\0');
  unsigned int len = 0;
  if (::EVP_DigestInit_ex(ctx.get(), ::EVP_sha256(), nullptr) != 1 ||
      ::EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
      ::EVP_DigestFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(digest.data()), &len) != 1) {
    throw std::runtime_error("SHA-256 digest computation failed");
  }
  digest.resize(len);
  return digest;
}

}  // namespace courier
