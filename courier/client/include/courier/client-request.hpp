#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "courier/basic-auth.hpp"
#include "courier/compression-config.hpp"
#include "courier/connection-key.hpp"
#include "courier/connection.hpp"
#include "courier/encoding.hpp"
#include "courier/future.hpp"
#include "courier/http-headers.hpp"
#include "courier/http-version.hpp"
#include "courier/payload.hpp"
#include "courier/request-info.hpp"
#include "courier/request-options.hpp"
#include "courier/scheduler.hpp"
#include "courier/ssl-policy.hpp"
#include "courier/stream-writer.hpp"
#include "courier/task-slot.hpp"
#include "courier/task.hpp"
#include "courier/trace.hpp"
#include "courier/url.hpp"

namespace courier {

class ClientResponse;

// A request to send on an established connection.
// The constructor negotiates the final header set (host, default headers, cookies, content coding, auth, proxy
// authorization, framing, 100-continue) and throws on conflicting settings. send() writes the head and spawns the
// task streaming the body.
class ClientRequest {
 public:
  enum class State : std::uint8_t { Built, Sending, WritingBody, Streamed, Closed, Terminated };

  // Throws MethodSyntaxError for a method that is not a token, InvalidUrl for a URL without host,
  // ConfigurationConflict for incompatible framing or coding settings, std::invalid_argument for an unsupported
  // content coding.
  // 'scheduler' must outlive send() and close(). Responses only keep its closed flag.
  ClientRequest(std::string_view method, const Url& url, async::Scheduler& scheduler, RequestOptions options = {});

  // The writer task and the completion observer keep references to this object.
  ClientRequest(const ClientRequest&) = delete;
  ClientRequest(ClientRequest&&) noexcept = delete;
  ClientRequest& operator=(const ClientRequest&) = delete;
  ClientRequest& operator=(ClientRequest&&) noexcept = delete;

  ~ClientRequest();

  [[nodiscard]] const std::string& method() const noexcept { return _method; }

  // Target URL, without fragment.
  [[nodiscard]] const Url& url() const noexcept { return _url; }

  // URL as given, with the query params appended and the fragment kept.
  [[nodiscard]] const Url& originalUrl() const noexcept { return _originalUrl; }

  [[nodiscard]] http::Version version() const noexcept { return _version; }

  [[nodiscard]] const http::Headers& headers() const noexcept { return _headers; }

  [[nodiscard]] const std::vector<std::string>& skipAutoHeaders() const noexcept { return _skipAutoHeaders; }

  [[nodiscard]] const std::optional<BasicAuth>& auth() const noexcept { return _auth; }

  [[nodiscard]] const std::shared_ptr<Payload>& body() const noexcept { return _body; }

  // True if the body is sent with chunked framing, requested or forced by compression or an unknown size.
  [[nodiscard]] bool chunked() const noexcept { return _chunked; }

  [[nodiscard]] std::optional<Encoding> compress() const noexcept { return _compress; }

  // Resolved with true by the first informational response when 'Expect: 100-continue' is sent.
  [[nodiscard]] const std::optional<async::Future<bool>>& continueWaiter() const noexcept { return _continue; }

  [[nodiscard]] const std::optional<Url>& proxy() const noexcept { return _proxy; }
  [[nodiscard]] const std::optional<BasicAuth>& proxyAuth() const noexcept { return _proxyAuth; }
  [[nodiscard]] const std::optional<http::Headers>& proxyHeaders() const noexcept { return _proxyHeaders; }

  [[nodiscard]] const SslPolicy& ssl() const noexcept { return _ssl; }

  [[nodiscard]] const std::optional<std::string>& serverHostname() const noexcept { return _serverHostname; }

  // True for https and wss URLs.
  [[nodiscard]] bool isSsl() const noexcept;

  [[nodiscard]] const std::string& host() const noexcept { return _url.rawHost(); }

  [[nodiscard]] std::optional<uint16_t> port() const noexcept { return _url.port(); }

  [[nodiscard]] ConnectionKey connectionKey() const;

  [[nodiscard]] RequestInfo requestInfo() const;

  // Whether the connection may be reused after this exchange, from the version and the Connection header.
  [[nodiscard]] bool keepAlive() const noexcept;

  [[nodiscard]] State state() const noexcept { return *_state; }

  // Pending body writer task. Empty before send() and once the task completed.
  [[nodiscard]] const async::TaskSlot& writer() const noexcept { return _writer; }

  // Response created by send(), nullptr before.
  [[nodiscard]] const std::shared_ptr<ClientResponse>& response() const noexcept { return _response; }

  // Checks the pinned fingerprint, writes the status line and headers, then starts the body writer task.
  // Throws std::logic_error if the request was already sent, ServerFingerprintMismatch when the peer certificate
  // does not match, std::invalid_argument if a header cannot be serialized.
  async::Task<std::shared_ptr<ClientResponse>> send(std::shared_ptr<Connection> connection);

  // Waits for the body writer. Its cancellation is not reported.
  async::Task<void> close();

  // Cancels the body writer, if any, and forgets it.
  void terminate();

 private:
  struct WriteContext;

  void updateHost();
  void updateHeaders(const http::Headers& headers);
  void updateAutoHeaders();
  void updateCookies(const RequestCookies& cookies);
  void updateContentEncoding(const std::optional<std::string>& compress);
  void updateAuth(std::optional<BasicAuth> auth, bool trustEnv);
  void updateProxy(std::optional<Url> proxy, std::optional<BasicAuth> proxyAuth,
                   std::optional<http::Headers> proxyHeaders);
  void updateBodyFromData();
  void updateTransferEncoding();
  void updateExpectContinue(bool expect);

  [[nodiscard]] bool isSkipped(std::string_view name) const noexcept;

  // Request target of the status line: authority form, absolute form or origin form.
  [[nodiscard]] std::string requestTarget() const;

  static async::Task<void> WriteBytes(std::shared_ptr<WriteContext> ctx);

  std::string _method;
  Url _originalUrl;
  Url _url;
  http::Version _version;
  http::Headers _headers;
  std::vector<std::string> _skipAutoHeaders;
  std::optional<BasicAuth> _auth;
  std::shared_ptr<Payload> _body;
  std::optional<Encoding> _compress;
  std::optional<async::Future<bool>> _continue;
  std::optional<Url> _proxy;
  std::optional<BasicAuth> _proxyAuth;
  std::optional<http::Headers> _proxyHeaders;
  SslPolicy _ssl;
  std::optional<std::string> _serverHostname;
  Traces _traces;
  CharsetResolver _charsetResolver;
  CompressionConfig _compressionConfig;
  async::Scheduler* _scheduler;
  std::shared_ptr<State> _state;
  std::shared_ptr<ClientResponse> _response;
  async::TaskSlot _writer;
  bool _chunked{false};
  bool _chunkedRequested{false};
};

}  // namespace courier
