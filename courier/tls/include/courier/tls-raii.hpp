#pragma once

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <memory>
#include <new>

namespace courier {

// Function pointer deleters keep the size of these types to one pointer.
using SslCtxPtr = std::unique_ptr<SSL_CTX, decltype(&::SSL_CTX_free)>;
using SslPtr = std::unique_ptr<SSL, decltype(&::SSL_free)>;
using BioPtr = std::unique_ptr<BIO, decltype(&::BIO_free)>;
using X509Ptr = std::unique_ptr<X509, decltype(&::X509_free)>;
using PKeyPtr = std::unique_ptr<EVP_PKEY, decltype(&::EVP_PKEY_free)>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&::EVP_MD_CTX_free)>;

inline SslCtxPtr MakeSslCtx(const SSL_METHOD* method) {
  SSL_CTX* ctx = ::SSL_CTX_new(method);
  if (ctx == nullptr) {
    throw std::bad_alloc();
  }
  return {ctx, ::SSL_CTX_free};
}

inline SslPtr MakeSsl(SSL_CTX* ctx) {
  SSL* ssl = ::SSL_new(ctx);
  if (ssl == nullptr) {
    throw std::bad_alloc();
  }
  return {ssl, ::SSL_free};
}

inline BioPtr MakeBio(BIO* bio) {
  if (bio == nullptr) {
    throw std::bad_alloc();
  }
  return {bio, ::BIO_free};
}

inline BioPtr MakeMemBio(const void* data, int len) { return MakeBio(BIO_new_mem_buf(data, len)); }

inline BioPtr MakeMemoryBio() { return MakeBio(BIO_new(BIO_s_mem())); }

inline MdCtxPtr MakeMdCtx() {
  EVP_MD_CTX* ctx = ::EVP_MD_CTX_new();
  if (ctx == nullptr) {
    throw std::bad_alloc();
  }
  return {ctx, ::EVP_MD_CTX_free};
}

// Takes ownership of 'x509', which may be null (no certificate).
inline X509Ptr AdoptX509(X509* x509) noexcept { return {x509, ::X509_free}; }

}  // namespace courier
