#include "courier/ssl-policy.hpp"

#include <gtest/gtest.h>
#include <openssl/ssl.h>

#include <new>
#include <string>

#include "courier/fingerprint.hpp"

namespace courier {

TEST(SslPolicy, Equality) {
  const SslPolicy verify = true;
  const SslPolicy noVerify = false;
  EXPECT_EQ(verify, SslPolicy{true});
  EXPECT_NE(verify, noVerify);

  const auto ctx1 = MakeSharedSslContext(::SSL_CTX_new(::TLS_client_method()));
  const auto ctx2 = MakeSharedSslContext(::SSL_CTX_new(::TLS_client_method()));
  EXPECT_EQ(SslPolicy{ctx1}, SslPolicy{ctx1});
  EXPECT_NE(SslPolicy{ctx1}, SslPolicy{ctx2});

  const SslPolicy fp1 = Fingerprint(std::string(32, 'a'));
  const SslPolicy fp2 = Fingerprint(std::string(32, 'a'));
  const SslPolicy fp3 = Fingerprint(std::string(32, 'b'));
  EXPECT_EQ(fp1, fp2);
  EXPECT_NE(fp1, fp3);
  EXPECT_NE(fp1, verify);
}

TEST(SslPolicy, HashFollowsEquality) {
  const SslPolicy fp1 = Fingerprint(std::string(32, 'a'));
  const SslPolicy fp2 = Fingerprint(std::string(32, 'a'));
  EXPECT_EQ(HashSslPolicy(fp1), HashSslPolicy(fp2));
  EXPECT_EQ(HashSslPolicy(SslPolicy{true}), HashSslPolicy(SslPolicy{true}));

  const auto ctx = MakeSharedSslContext(::SSL_CTX_new(::TLS_client_method()));
  const SslPolicy copy = ctx;
  EXPECT_EQ(HashSslPolicy(SslPolicy{ctx}), HashSslPolicy(copy));
}

TEST(SslPolicy, PinnedFingerprint) {
  EXPECT_EQ(PinnedFingerprint(SslPolicy{true}), nullptr);
  const SslPolicy pinned = Fingerprint(std::string(32, 'c'));
  ASSERT_NE(PinnedFingerprint(pinned), nullptr);
  EXPECT_EQ(PinnedFingerprint(pinned)->digest(), std::string(32, 'c'));
}

TEST(SslPolicy, NullContextThrows) { EXPECT_THROW((void)MakeSharedSslContext(nullptr), std::bad_alloc); }

}  // namespace courier
