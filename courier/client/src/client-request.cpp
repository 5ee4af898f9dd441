#include "courier/client-request.hpp"

#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

#include <fmt/format.h>

#include "courier/ascii.hpp"
#include "courier/basic-auth.hpp"
#include "courier/cancelled-error.hpp"
#include "courier/client-errors.hpp"
#include "courier/client-response.hpp"
#include "courier/connection-key.hpp"
#include "courier/connection.hpp"
#include "courier/cookies.hpp"
#include "courier/encoding.hpp"
#include "courier/fingerprint.hpp"
#include "courier/http-constants.hpp"
#include "courier/http-headers.hpp"
#include "courier/http-method.hpp"
#include "courier/http-version.hpp"
#include "courier/log.hpp"
#include "courier/netrc.hpp"
#include "courier/payload.hpp"
#include "courier/protocol.hpp"
#include "courier/scheduler.hpp"
#include "courier/ssl-policy.hpp"
#include "courier/stream-writer.hpp"
#include "courier/task.hpp"
#include "courier/url.hpp"
#include "courier/version.hpp"

namespace courier {

namespace {

constexpr std::string_view kAcceptAny = "*/*";

// Converts a failure of the body writer to the error reported to the response reader.
std::exception_ptr WriteFailure(const std::exception_ptr& ex, const std::string& url) {
  try {
    std::rethrow_exception(ex);
  } catch (const std::system_error& err) {
    if (err.code() == std::errc::timed_out) {
      return ex;
    }
    return std::make_exception_ptr(
        ConnectionWriteError(err.code(), fmt::format("Can not write request body for {}", url)));
  } catch (const std::exception& err) {
    return std::make_exception_ptr(ClientConnectionError(
        fmt::format("Failed to send bytes into the underlying connection for {}: {}", url, err.what())));
  }
}

}  // namespace

// Everything the body writer task needs, kept alive by the task itself.
struct ClientRequest::WriteContext {
  std::shared_ptr<Payload> body;
  std::shared_ptr<StreamWriter> writer;
  std::shared_ptr<Connection> connection;
  Protocol* protocol;
  std::optional<async::Future<bool>> continueWaiter;
  std::shared_ptr<State> state;
  std::string url;
};

ClientRequest::ClientRequest(std::string_view method, const Url& url, async::Scheduler& scheduler,
                             RequestOptions options)
    : _method(http::NormalizeMethod(method)),
      _originalUrl(options.params.empty() ? url : url.withQueryParams(options.params)),
      _url(_originalUrl.withoutFragment()),
      _version(options.version),
      _skipAutoHeaders(std::move(options.skipAutoHeaders)),
      _body(MakePayload(std::move(options.data))),
      _ssl(std::move(options.ssl)),
      _serverHostname(std::move(options.serverHostname)),
      _traces(std::move(options.traces)),
      _charsetResolver(std::move(options.charsetResolver)),
      _compressionConfig(options.compressionConfig),
      _scheduler(&scheduler),
      _state(std::make_shared<State>(State::Built)),
      _chunked(options.chunked.value_or(false)),
      _chunkedRequested(options.chunked.value_or(false)) {
  updateHost();
  updateHeaders(options.headers);
  updateAutoHeaders();
  updateCookies(options.cookies);
  updateContentEncoding(options.compress);
  updateAuth(std::move(options.auth), options.trustEnv);
  updateProxy(std::move(options.proxy), std::move(options.proxyAuth), std::move(options.proxyHeaders));

  updateBodyFromData();
  if (_body || !http::IsBodylessMethod(_method)) {
    updateTransferEncoding();
  }
  updateExpectContinue(options.expect100);
}

ClientRequest::~ClientRequest() = default;

void ClientRequest::updateHost() {
  if (_url.rawHost().empty()) {
    throw InvalidUrl(_url.toString());
  }
  _auth = BasicAuth::FromUrl(_url);
}

void ClientRequest::updateHeaders(const http::Headers& headers) {
  std::string netloc;
  if (_url.isIpv6Host()) {
    netloc = fmt::format("[{}]", _url.rawHost());
  } else {
    std::string_view host = _url.rawHost();
    while (!host.empty() && host.back() == '.') {
      host.remove_suffix(1);
    }
    netloc.assign(host);
  }
  if (_url.port() && !_url.isDefaultPort()) {
    netloc.push_back(':');
    netloc.append(std::to_string(*_url.port()));
  }
  _headers.set(http::Host, netloc);

  for (const auto& [name, value] : headers) {
    if (CaseInsensitiveEqual(name, http::Host)) {
      _headers.set(name, value);
    } else {
      _headers.add(name, value);
    }
  }
}

void ClientRequest::updateAutoHeaders() {
  const auto addIfUnused = [this](std::string_view name, std::string_view value) {
    if (!_headers.contains(name) && !isSkipped(name)) {
      _headers.add(name, value);
    }
  };
  addIfUnused(http::Accept, kAcceptAny);
  addIfUnused(http::AcceptEncoding, DefaultAcceptEncoding());
  addIfUnused(http::UserAgent, userAgent());
}

void ClientRequest::updateCookies(const RequestCookies& cookies) {
  if (cookies.empty()) {
    return;
  }

  Cookies jar;
  if (auto existing = _headers.get(http::Cookie)) {
    jar.load(*existing);
    _headers.erase(http::Cookie);
  }

  for (const auto& [name, value] : cookies) {
    std::visit(
        [&jar, &name](const auto& val) {
          using T = std::decay_t<decltype(val)>;
          if constexpr (std::is_same_v<T, Morsel>) {
            jar.setMorsel(name, val);
          } else {
            jar.set(name, val);
          }
        },
        value);
  }

  _headers.set(http::Cookie, jar.output());
}

void ClientRequest::updateContentEncoding(const std::optional<std::string>& compress) {
  if (!_body) {
    return;
  }

  if (!_headers.getOr(http::ContentEncoding, "").empty()) {
    if (compress) {
      throw ConfigurationConflict("compress can not be set if Content-Encoding header is set");
    }
  } else if (compress) {
    const auto encoding = ParseEncoding(*compress);
    if (!encoding) {
      throw std::invalid_argument(fmt::format("Unsupported content coding '{}'", *compress));
    }
    if (!IsEncodingEnabled(*encoding)) {
      throw std::invalid_argument(
          fmt::format("Content coding '{}' is not available in this build", GetEncodingStr(*encoding)));
    }
    _compress = encoding;
    _headers.set(http::ContentEncoding, GetEncodingStr(*encoding));
    _chunked = true;
  }
}

void ClientRequest::updateAuth(std::optional<BasicAuth> auth, bool trustEnv) {
  if (!auth) {
    auth = std::move(_auth);
  }
  if (!auth && trustEnv) {
    try {
      auth = BasicAuthFromNetrc(NetrcFromEnv(), _url.rawHost());
    } catch (const std::out_of_range& ex) {
      ClientLog()->debug("{}", ex.what());
    }
  }
  _auth = std::move(auth);
  if (_auth) {
    _headers.set(http::Authorization, _auth->encode());
  }
}

void ClientRequest::updateProxy(std::optional<Url> proxy, std::optional<BasicAuth> proxyAuth,
                                std::optional<http::Headers> proxyHeaders) {
  _proxy = std::move(proxy);
  _proxyAuth = std::move(proxyAuth);
  _proxyHeaders = std::move(proxyHeaders);
  if (_proxy && _proxyAuth && !isSsl() && !_headers.contains(http::ProxyAuthorization)) {
    _headers.add(http::ProxyAuthorization, _proxyAuth->encode());
  }
}

void ClientRequest::updateBodyFromData() {
  if (!_body) {
    return;
  }

  const bool chunkedHeader = ContainsCaseInsensitive(_headers.getOr(http::TransferEncoding, ""), http::chunked);
  if (!_chunked && !chunkedHeader && !_headers.contains(http::ContentLength)) {
    if (const auto size = _body->size()) {
      _headers.set(http::ContentLength, std::to_string(*size));
    } else {
      _chunked = true;
    }
  }

  for (const auto& [name, value] : _body->headers()) {
    if (_headers.contains(name) || isSkipped(name)) {
      continue;
    }
    _headers.set(name, value);
  }
}

void ClientRequest::updateTransferEncoding() {
  if (ContainsCaseInsensitive(_headers.getOr(http::TransferEncoding, ""), http::chunked)) {
    if (_chunkedRequested) {
      throw ConfigurationConflict(R"(chunked can not be set if "Transfer-Encoding: chunked" header is set)");
    }
    if (_headers.contains(http::ContentLength)) {
      throw ConfigurationConflict(R"(Content-Length can not be set if "Transfer-Encoding: chunked" header is set)");
    }
  } else if (_chunked) {
    if (_headers.contains(http::ContentLength)) {
      throw ConfigurationConflict("chunked can not be set if Content-Length header is set");
    }
    _headers.set(http::TransferEncoding, http::chunked);
  } else if (!_headers.contains(http::ContentLength)) {
    const std::size_t length = _body ? _body->size().value_or(0) : 0;
    _headers.set(http::ContentLength, std::to_string(length));
  }
}

void ClientRequest::updateExpectContinue(bool expect) {
  if (expect) {
    _headers.set(http::Expect, http::h100continue);
  } else if (CaseInsensitiveEqual(_headers.getOr(http::Expect, ""), http::h100continue)) {
    expect = true;
  }
  if (expect) {
    _continue.emplace();
  }
}

bool ClientRequest::isSkipped(std::string_view name) const noexcept {
  for (const auto& skipped : _skipAutoHeaders) {
    if (CaseInsensitiveEqual(skipped, name)) {
      return true;
    }
  }
  return false;
}

bool ClientRequest::isSsl() const noexcept { return _url.scheme() == "https" || _url.scheme() == "wss"; }

ConnectionKey ClientRequest::connectionKey() const {
  std::optional<std::size_t> proxyHeadersHash;
  if (_proxyHeaders && !_proxyHeaders->empty()) {
    proxyHeadersHash = _proxyHeaders->hash();
  }
  return ConnectionKey{_url.rawHost(), _url.port(), isSsl(), _ssl, _proxy, _proxyAuth, proxyHeadersHash};
}

RequestInfo ClientRequest::requestInfo() const { return RequestInfo{_url, _method, _headers, _originalUrl}; }

bool ClientRequest::keepAlive() const noexcept {
  if (_version < http::HTTP_1_0) {
    return false;
  }
  const auto connection = _headers.get(http::Connection);
  if (_version == http::HTTP_1_0) {
    return connection && CaseInsensitiveEqual(*connection, http::keepalive);
  }
  return !connection || !CaseInsensitiveEqual(*connection, http::close);
}

std::string ClientRequest::requestTarget() const {
  if (_method == http::CONNECT) {
    if (_url.isIpv6Host()) {
      return fmt::format("[{}]:{}", _url.rawHost(), _url.port().value_or(0));
    }
    return fmt::format("{}:{}", _url.rawHost(), _url.port().value_or(0));
  }
  if (_proxy && !isSsl()) {
    return _url.withoutUserInfo().toString();
  }
  std::string target = _url.rawPath().empty() ? std::string("/") : _url.rawPath();
  if (_url.rawQuery() && !_url.rawQuery()->empty()) {
    target.push_back('?');
    target.append(*_url.rawQuery());
  }
  return target;
}

async::Task<std::shared_ptr<ClientResponse>> ClientRequest::send(std::shared_ptr<Connection> connection) {
  if (*_state != State::Built) {
    throw std::logic_error("Request already sent");
  }
  Protocol* protocol = connection ? connection->protocol() : nullptr;
  if (protocol == nullptr) {
    throw std::invalid_argument("Cannot send a request on a connection without protocol");
  }
  if (const Fingerprint* fingerprint = PinnedFingerprint(_ssl); fingerprint != nullptr) {
    if (const TransportInfo* transport = protocol->transport(); transport != nullptr) {
      fingerprint->check(*transport);
    }
  }

  const std::string target = requestTarget();

  auto writer = std::make_shared<StreamWriter>(
      *protocol,
      [traces = _traces, method = _method, url = _url](std::string_view chunk) {
        for (const auto& trace : traces) {
          trace->onRequestChunkSent(method, url, chunk);
        }
      },
      [traces = _traces, method = _method, url = _url](const http::Headers& headers) {
        for (const auto& trace : traces) {
          trace->onRequestHeadersSent(method, url, headers);
        }
      });

  if (_compress) {
    writer->enableCompression(*_compress, _compressionConfig);
  }

  if (http::IsPostMethod(_method) && !isSkipped(http::ContentType) && !_headers.contains(http::ContentType)) {
    _headers.set(http::ContentType, http::ContentTypeOctetStream);
  }

  if (_headers.getOr(http::Connection, "").empty()) {
    if (keepAlive()) {
      if (_version == http::HTTP_1_0) {
        _headers.set(http::Connection, http::keepalive);
      }
    } else if (_version == http::HTTP_1_1) {
      _headers.set(http::Connection, http::close);
    }
  }

  if (ContainsCaseInsensitive(_headers.getOr(http::TransferEncoding, ""), http::chunked)) {
    writer->enableChunking();
  }

  writer->writeHeaders(fmt::format("{} {} {}", _method, target, _version.str()), _headers);
  *_state = State::Sending;

  auto ctx = std::make_shared<WriteContext>(_body, writer, connection, protocol, _continue, _state, _url.toString());
  async::TaskHandle handle = _scheduler->spawn(WriteBytes(std::move(ctx)), async::Scheduler::StartMode::Eager);
  _writer.assign(handle);

  _response = std::make_shared<ClientResponse>(_method, _originalUrl, std::move(handle), _continue, requestInfo(),
                                               _traces, *_scheduler, _charsetResolver);
  co_return _response;
}

async::Task<void> ClientRequest::WriteBytes(std::shared_ptr<WriteContext> ctx) {
  if (ctx->continueWaiter) {
    bool cancelled = false;
    try {
      co_await ctx->writer->drain();
      co_await *ctx->continueWaiter;
    } catch (const async::CancelledError&) {
      cancelled = true;
    }
    if (cancelled) {
      log::debug("Body writer of {} cancelled while waiting for 100-continue", ctx->url);
      co_return;
    }
  }

  *ctx->state = State::WritingBody;
  std::exception_ptr failure;
  bool cancelled = false;
  try {
    if (ctx->body) {
      co_await ctx->body->write(*ctx->writer);
    }
    co_await ctx->writer->writeEof();
  } catch (const async::CancelledError&) {
    cancelled = true;
  } catch (const std::exception&) {
    failure = WriteFailure(std::current_exception(), ctx->url);
  }

  if (cancelled) {
    try {
      co_await ctx->writer->writeEof();
    } catch (const async::CancelledError&) {
      log::debug("Body writer of {} cancelled again while ending the body", ctx->url);
    } catch (const std::exception&) {
      failure = WriteFailure(std::current_exception(), ctx->url);
    }
  }

  if (failure) {
    ctx->protocol->setException(std::move(failure));
    co_return;
  }
  if (!cancelled) {
    ctx->protocol->startTimeout();
    *ctx->state = State::Streamed;
  }
}

async::Task<void> ClientRequest::close() {
  if (!_writer.empty()) {
    const async::TaskHandle writer = _writer.handle();
    try {
      co_await writer.wait();
    } catch (const async::CancelledError&) {
      log::trace("Body writer of {} was cancelled", _url.toString());
    }
  }
  if (*_state != State::Terminated) {
    *_state = State::Closed;
  }
}

void ClientRequest::terminate() {
  if (!_writer.empty()) {
    async::TaskHandle writer = _writer.handle();
    writer.cancel();
    _writer.reset();
  }
  *_state = State::Terminated;
}

}  // namespace courier
