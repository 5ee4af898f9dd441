#include "courier/test-tls-helper.hpp"

#include <openssl/asn1.h>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "courier/tls-raii.hpp"

namespace courier::test {

namespace {

using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&::EVP_PKEY_CTX_free)>;

PKeyPtr GenerateKey(KeyAlgorithm alg) {
  const bool rsa = alg == KeyAlgorithm::Rsa2048;
  PkeyCtxPtr kctx(::EVP_PKEY_CTX_new_from_name(nullptr, rsa ? "RSA" : "EC", nullptr), ::EVP_PKEY_CTX_free);
  if (!kctx || ::EVP_PKEY_keygen_init(kctx.get()) != 1) {
    throw std::runtime_error("EVP_PKEY_keygen_init failed");
  }
  if (rsa) {
    if (::EVP_PKEY_CTX_set_rsa_keygen_bits(kctx.get(), 2048) != 1) {
      throw std::runtime_error("Unable to set RSA key size");
    }
  } else if (::EVP_PKEY_CTX_set_ec_paramgen_curve_nid(kctx.get(), NID_X9_62_prime256v1) != 1) {
    throw std::runtime_error("Unable to set EC curve");
  }
  EVP_PKEY* pkey = nullptr;
  if (::EVP_PKEY_keygen(kctx.get(), &pkey) != 1) {
    throw std::runtime_error("EVP_PKEY_keygen failed");
  }
  return {pkey, ::EVP_PKEY_free};
}

std::string BioContent(BIO* bio) {
  char* data = nullptr;
  const long len = BIO_get_mem_data(bio, &data);
  return {data, static_cast<std::size_t>(len)};
}

X509Ptr ReadCertificate(const std::string& certPem) {
  auto bio = MakeMemBio(certPem.data(), static_cast<int>(certPem.size()));
  X509Ptr cert = AdoptX509(::PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
  if (!cert) {
    throw std::runtime_error("Invalid PEM certificate");
  }
  return cert;
}

PKeyPtr ReadPrivateKey(const std::string& keyPem) {
  auto bio = MakeMemBio(keyPem.data(), static_cast<int>(keyPem.size()));
  EVP_PKEY* pkey = ::PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);
  if (pkey == nullptr) {
    throw std::runtime_error("Invalid PEM private key");
  }
  return {pkey, ::EVP_PKEY_free};
}

bool HandshakeProgress(SSL* ssl) {
  const int rc = ::SSL_do_handshake(ssl);
  if (rc == 1) {
    return true;
  }
  const int err = ::SSL_get_error(ssl, rc);
  if (err != SSL_ERROR_WANT_READ && err != SSL_ERROR_WANT_WRITE) {
    throw std::runtime_error("TLS handshake failed");
  }
  return false;
}

}  // namespace

std::pair<std::string, std::string> MakeEphemeralCertKey(const char* commonName, int validSeconds, KeyAlgorithm alg) {
  auto pkey = GenerateKey(alg);

  X509Ptr x509Ptr = AdoptX509(::X509_new());
  X509* x509 = x509Ptr.get();
  if (x509 == nullptr) {
    throw std::bad_alloc();
  }
  ASN1_INTEGER_set(X509_get_serialNumber(x509), 1);
  X509_gmtime_adj(X509_getm_notBefore(x509), 0);
  X509_gmtime_adj(X509_getm_notAfter(x509), validSeconds);
  X509_set_pubkey(x509, pkey.get());
  X509_NAME* name = X509_get_subject_name(x509);
  X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC, reinterpret_cast<const unsigned char*>("CourierTest"), -1, -1, 0);
  X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, reinterpret_cast<const unsigned char*>(commonName), -1, -1, 0);
  X509_set_issuer_name(x509, name);
  if (X509_sign(x509, pkey.get(), EVP_sha256()) <= 0) {
    throw std::runtime_error("X509_sign failed");
  }

  auto certBio = MakeMemoryBio();
  auto keyBio = MakeMemoryBio();
  if (PEM_write_bio_X509(certBio.get(), x509) != 1 ||
      PEM_write_bio_PrivateKey(keyBio.get(), pkey.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1) {
    throw std::runtime_error("PEM serialization failed");
  }
  return {BioContent(certBio.get()), BioContent(keyBio.get())};
}

std::string PemCertificateToDer(const std::string& certPem) {
  X509Ptr cert = ReadCertificate(certPem);
  const int len = ::i2d_X509(cert.get(), nullptr);
  if (len <= 0) {
    throw std::runtime_error("i2d_X509 failed");
  }
  std::string der(static_cast<std::size_t>(len), '\0');
  auto* out = reinterpret_cast<unsigned char*>(der.data());
  ::i2d_X509(cert.get(), &out);
  return der;
}

TlsLoopback::TlsLoopback(const char* commonName)
    : _serverCtx(MakeSslCtx(::TLS_server_method())),
      _clientCtx(MakeSslCtx(::TLS_client_method())),
      _server(nullptr, ::SSL_free),
      _client(nullptr, ::SSL_free) {
  const auto [certPem, keyPem] = MakeEphemeralCertKey(commonName);
  _certDer = PemCertificateToDer(certPem);

  X509Ptr cert = ReadCertificate(certPem);
  PKeyPtr key = ReadPrivateKey(keyPem);
  if (::SSL_CTX_use_certificate(_serverCtx.get(), cert.get()) != 1 ||
      ::SSL_CTX_use_PrivateKey(_serverCtx.get(), key.get()) != 1) {
    throw std::runtime_error("Unable to install the server certificate");
  }
  ::SSL_CTX_set_verify(_clientCtx.get(), SSL_VERIFY_NONE, nullptr);

  _server = MakeSsl(_serverCtx.get());
  _client = MakeSsl(_clientCtx.get());

  BIO* serverBio = nullptr;
  BIO* clientBio = nullptr;
  if (::BIO_new_bio_pair(&serverBio, 0, &clientBio, 0) != 1) {
    throw std::runtime_error("BIO_new_bio_pair failed");
  }
  // Each SSL object takes ownership of its end of the pair.
  ::SSL_set_bio(_server.get(), serverBio, serverBio);
  ::SSL_set_bio(_client.get(), clientBio, clientBio);
  ::SSL_set_accept_state(_server.get());
  ::SSL_set_connect_state(_client.get());

  static constexpr int kMaxRounds = 64;
  bool clientDone = false;
  bool serverDone = false;
  for (int round = 0; round < kMaxRounds && !(clientDone && serverDone); ++round) {
    clientDone = HandshakeProgress(_client.get());
    serverDone = HandshakeProgress(_server.get());
  }
  if (!clientDone || !serverDone) {
    throw std::runtime_error("TLS handshake did not complete");
  }
}

}  // namespace courier::test
