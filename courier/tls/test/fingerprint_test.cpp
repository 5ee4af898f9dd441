#include "courier/fingerprint.hpp"

#include <gtest/gtest.h>

#include <string>
#include <utility>

#include "courier/client-errors.hpp"
#include "courier/test-tls-helper.hpp"
#include "courier/transport-info.hpp"

namespace courier {

namespace {

class FakeTlsTransport final : public TransportInfo {
 public:
  explicit FakeTlsTransport(std::string der) : _der(std::move(der)) {}

  [[nodiscard]] bool tlsActive() const noexcept override { return true; }
  [[nodiscard]] std::string peerCertificateDer() const override { return _der; }
  [[nodiscard]] const PeerAddress& peerAddress() const noexcept override { return _peer; }

 private:
  std::string _der;
  PeerAddress _peer{"example.com", 443};
};

}  // namespace

TEST(Fingerprint, Lengths) {
  EXPECT_THROW(Fingerprint(std::string(16, 'a')), FingerprintInsecureAlgorithm);
  EXPECT_THROW(Fingerprint(std::string(20, 'a')), FingerprintInsecureAlgorithm);
  EXPECT_THROW(Fingerprint(std::string(31, 'a')), FingerprintLengthError);
  EXPECT_THROW(Fingerprint(std::string()), FingerprintLengthError);
  EXPECT_NO_THROW(Fingerprint(std::string(32, 'a')));
}

TEST(Fingerprint, InsecureMessage) {
  try {
    Fingerprint fp(std::string(20, 'x'));
    FAIL() << "expected an exception";
  } catch (const FingerprintInsecureAlgorithm& ex) {
    EXPECT_STREQ(ex.what(), "md5 and sha1 are insecure and not supported. Use sha256.");
  }
}

TEST(Fingerprint, Sha256KnownValue) {
  const auto digest = Sha256Digest("abc");
  ASSERT_EQ(digest.size(), Fingerprint::kSha256Size);
  EXPECT_EQ(static_cast<unsigned char>(digest[0]), 0xBAU);
  EXPECT_EQ(static_cast<unsigned char>(digest[1]), 0x78U);
  EXPECT_EQ(static_cast<unsigned char>(digest[31]), 0xADU);
}

TEST(Fingerprint, PlainTransportIsNotChecked) {
  const Fingerprint fp(std::string(32, 'a'));
  EXPECT_NO_THROW(fp.check(PlainTransportInfo({"example.com", 80})));
}

TEST(Fingerprint, MatchAndMismatch) {
  const FakeTlsTransport transport("certificate bytes");
  EXPECT_NO_THROW(Fingerprint(Sha256Digest("certificate bytes")).check(transport));

  const Fingerprint other(Sha256Digest("another certificate"));
  try {
    other.check(transport);
    FAIL() << "expected a mismatch";
  } catch (const ServerFingerprintMismatch& ex) {
    EXPECT_EQ(ex.expected(), other.digest());
    EXPECT_EQ(ex.got(), Sha256Digest("certificate bytes"));
    EXPECT_EQ(ex.host(), "example.com");
    EXPECT_EQ(ex.port(), 443);
  }
}

TEST(Fingerprint, MissingCertificateIsAMismatch) {
  const FakeTlsTransport transport("");
  EXPECT_THROW(Fingerprint(std::string(32, 'a')).check(transport), ServerFingerprintMismatch);
}

TEST(Fingerprint, RealHandshake) {
  const test::TlsLoopback loopback;
  const SslTransportInfo transport(loopback.clientSsl(), {"localhost", 8443});
  EXPECT_TRUE(transport.tlsActive());
  EXPECT_EQ(transport.peerCertificateDer(), loopback.serverCertificateDer());

  EXPECT_NO_THROW(Fingerprint(Sha256Digest(loopback.serverCertificateDer())).check(transport));
  EXPECT_THROW(Fingerprint(Sha256Digest("other")).check(transport), ServerFingerprintMismatch);
}

TEST(Fingerprint, NullSslIsPlain) {
  const SslTransportInfo transport(nullptr, {"localhost", 80});
  EXPECT_FALSE(transport.tlsActive());
  EXPECT_TRUE(transport.peerCertificateDer().empty());
  EXPECT_NO_THROW(Fingerprint(std::string(32, 'a')).check(transport));
}

}  // namespace courier
