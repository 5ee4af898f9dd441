#include "courier/connection-key.hpp"

#include <gtest/gtest.h>
#include <openssl/ssl.h>

#include <functional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>

#include "courier/basic-auth.hpp"
#include "courier/client-request.hpp"
#include "courier/fingerprint.hpp"
#include "courier/http-headers.hpp"
#include "courier/request-options.hpp"
#include "courier/scheduler.hpp"
#include "courier/ssl-policy.hpp"
#include "courier/url.hpp"

namespace courier {

class ConnectionKeyTest : public ::testing::Test {
 protected:
  ConnectionKey keyOf(std::string_view url, RequestOptions options = {}) {
    ClientRequest request("GET", Url::Parse(url), scheduler, std::move(options));
    return request.connectionKey();
  }

  async::Scheduler scheduler;
};

TEST_F(ConnectionKeyTest, EqualityLaws) {
  const auto k1 = keyOf("http://example.com/a");
  const auto k2 = keyOf("http://example.com/b?x=1");
  const auto k3 = keyOf("http://example.com/c#frag");
  EXPECT_EQ(k1, k1);
  EXPECT_EQ(k1, k2);
  EXPECT_EQ(k2, k1);
  EXPECT_EQ(k2, k3);
  EXPECT_EQ(k1, k3);
  EXPECT_EQ(std::hash<ConnectionKey>{}(k1), std::hash<ConnectionKey>{}(k3));
}

TEST_F(ConnectionKeyTest, Fields) {
  const auto key = keyOf("https://example.com:8443/");
  EXPECT_EQ(key.host, "example.com");
  EXPECT_EQ(key.port, 8443);
  EXPECT_TRUE(key.isSsl);
  EXPECT_FALSE(key.proxy.has_value());
  EXPECT_FALSE(key.proxyHeadersHash.has_value());
}

TEST_F(ConnectionKeyTest, DiffersByOrigin) {
  const auto base = keyOf("http://example.com/");
  EXPECT_NE(base, keyOf("http://example.org/"));
  EXPECT_NE(base, keyOf("http://example.com:8080/"));
  EXPECT_NE(base, keyOf("https://example.com:80/"));
  EXPECT_EQ(base, keyOf("http://example.com:80/"));
}

TEST_F(ConnectionKeyTest, DiffersBySslPolicy) {
  RequestOptions noVerify;
  noVerify.ssl = false;
  EXPECT_NE(keyOf("https://example.com/"), keyOf("https://example.com/", std::move(noVerify)));

  RequestOptions pinned;
  pinned.ssl = Fingerprint(std::string(32, 'a'));
  RequestOptions pinnedSame;
  pinnedSame.ssl = Fingerprint(std::string(32, 'a'));
  RequestOptions pinnedOther;
  pinnedOther.ssl = Fingerprint(std::string(32, 'b'));
  const auto pinnedKey = keyOf("https://example.com/", std::move(pinned));
  EXPECT_EQ(pinnedKey, keyOf("https://example.com/", std::move(pinnedSame)));
  EXPECT_NE(pinnedKey, keyOf("https://example.com/", std::move(pinnedOther)));
  EXPECT_NE(pinnedKey, keyOf("https://example.com/"));
}

TEST_F(ConnectionKeyTest, SslContextComparesByIdentity) {
  auto ctx1 = MakeSharedSslContext(SSL_CTX_new(TLS_client_method()));
  auto ctx2 = MakeSharedSslContext(SSL_CTX_new(TLS_client_method()));
  RequestOptions first;
  first.ssl = ctx1;
  RequestOptions sameContext;
  sameContext.ssl = ctx1;
  RequestOptions otherContext;
  otherContext.ssl = ctx2;
  const auto key = keyOf("https://example.com/", std::move(first));
  EXPECT_EQ(key, keyOf("https://example.com/", std::move(sameContext)));
  EXPECT_NE(key, keyOf("https://example.com/", std::move(otherContext)));
}

TEST_F(ConnectionKeyTest, DiffersByProxySetup) {
  const auto direct = keyOf("http://example.com/");

  RequestOptions proxied;
  proxied.proxy = Url::Parse("http://proxy:3128");
  const auto viaProxy = keyOf("http://example.com/", std::move(proxied));
  EXPECT_NE(direct, viaProxy);

  RequestOptions otherProxy;
  otherProxy.proxy = Url::Parse("http://proxy:3129");
  EXPECT_NE(viaProxy, keyOf("http://example.com/", std::move(otherProxy)));

  RequestOptions withAuth;
  withAuth.proxy = Url::Parse("http://proxy:3128");
  withAuth.proxyAuth = BasicAuth("user", "pass");
  EXPECT_NE(viaProxy, keyOf("http://example.com/", std::move(withAuth)));

  RequestOptions withHeaders;
  withHeaders.proxy = Url::Parse("http://proxy:3128");
  withHeaders.proxyHeaders = http::Headers{{"X-Proxy", "1"}};
  const auto headersKey = keyOf("http://example.com/", std::move(withHeaders));
  EXPECT_NE(viaProxy, headersKey);
  ASSERT_TRUE(headersKey.proxyHeadersHash.has_value());

  RequestOptions emptyHeaders;
  emptyHeaders.proxy = Url::Parse("http://proxy:3128");
  emptyHeaders.proxyHeaders = http::Headers{};
  EXPECT_EQ(viaProxy, keyOf("http://example.com/", std::move(emptyHeaders)));
}

TEST_F(ConnectionKeyTest, UsableAsHashKey) {
  std::unordered_set<ConnectionKey> pool;
  pool.insert(keyOf("http://example.com/a"));
  pool.insert(keyOf("http://example.com/b"));
  pool.insert(keyOf("https://example.com/"));
  EXPECT_EQ(pool.size(), 2U);
  EXPECT_TRUE(pool.contains(keyOf("https://example.com/other")));
}

}  // namespace courier
