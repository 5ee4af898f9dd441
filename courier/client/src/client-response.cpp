#include "courier/client-response.hpp"

#include <charconv>
#include <cstddef>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#include "courier/ascii.hpp"
#include "courier/charset.hpp"
#include "courier/client-errors.hpp"
#include "courier/connection.hpp"
#include "courier/content-disposition.hpp"
#include "courier/http-constants.hpp"
#include "courier/link-header.hpp"
#include "courier/log.hpp"
#include "courier/mime-type.hpp"
#include "courier/protocol.hpp"
#include "courier/response-error.hpp"
#include "courier/scheduler.hpp"
#include "courier/task.hpp"

namespace courier {

namespace {

constexpr std::string_view kUtf8 = "utf-8";

std::string DefaultCharset([[maybe_unused]] const ClientResponse& response, [[maybe_unused]] std::string_view body) {
  return std::string(kUtf8);
}

}  // namespace

ClientResponse::ClientResponse(std::string method, const Url& url, async::TaskHandle writer,
                               std::optional<async::Future<bool>> continue100, RequestInfo requestInfo,
                               Traces traces, async::Scheduler& scheduler, CharsetResolver charsetResolver)
    : _method(std::move(method)),
      _url(url.withoutFragment()),
      _realUrl(url),
      _requestInfo(std::move(requestInfo)),
      _traces(std::move(traces)),
      _charsetResolver(charsetResolver ? std::move(charsetResolver) : CharsetResolver(DefaultCharset)),
      _continue(std::move(continue100)),
      _schedulerClosed(scheduler.closedFlag()),
      _writer(std::move(writer)) {}

ClientResponse::~ClientResponse() {
  if (_state != State::Open && !_connection) {
    return;
  }
  if (_state == State::Open) {
    ClientLog()->warn("Unclosed response {}", _url.toString());
    cleanupWriter();
  }
  if (!_connection) {
    return;
  }
  auto connection = std::move(_connection);
  if (_writer.empty() || *_schedulerClosed) {
    connection->release();
  } else {
    async::TaskHandle writer = _writer.handle();
    writer.addDoneCallback([connection = std::move(connection)](const async::TaskHandle&) { connection->release(); });
  }
}

async::Task<void> ClientResponse::start(std::shared_ptr<Connection> connection) {
  Protocol* protocol = connection ? connection->protocol() : nullptr;
  if (protocol == nullptr) {
    throw std::invalid_argument("Cannot start a response on a connection without protocol");
  }
  _state = State::Open;
  _connection = std::move(connection);

  if (protocol->exception()) {
    std::rethrow_exception(protocol->exception());
  }

  ReadResult result;
  while (true) {
    try {
      result = co_await protocol->read();
    } catch (const HttpProcessingError& err) {
      throw ResponseError(_requestInfo, _history, err.code(), std::string(err.message()), err.headers());
    }

    const int status = result.head.status;
    if (status < 100 || status > 199 || status == 101) {
      break;
    }
    if (_continue) {
      if (!_continue->done()) {
        _continue->setResult(true);
      }
      _continue.reset();
    }
  }

  _version = result.head.version;
  _status = result.head.status;
  _reason = std::move(result.head.reason);
  _headers = std::move(result.head.headers);
  _rawHeaders = std::move(result.head.rawHeaders);
  _content = std::move(result.payload);

  for (std::string_view setCookie : _headers.getAll(http::SetCookie)) {
    try {
      _cookies.load(setCookie);
    } catch (const CookieError& ex) {
      ClientLog()->warn("Can not load response cookies: {}", ex.what());
    }
  }

  if (auto disposition = _headers.get(http::ContentDispositionHeader)) {
    _contentDisposition = http::ParseContentDisposition(*disposition);
  }
  _links = http::ParseLinks(_headers.getAll(http::LinkHeader), _url);

  if (_content) {
    _content->onEof([weakSelf = weak_from_this()] {
      if (auto self = weakSelf.lock()) {
        self->responseEof();
      }
    });
  }
}

void ClientResponse::setHistory(ResponseHistory history) {
  if (_historySet) {
    throw std::logic_error("Response history is already set");
  }
  _history = std::move(history);
  _historySet = true;
}

std::string ClientResponse::contentType() const {
  const auto raw = _headers.get(http::ContentType);
  if (!raw) {
    return std::string(http::ContentTypeOctetStream);
  }
  std::string essence = http::ParseMimeType(*raw).essence();
  if (essence.empty()) {
    return std::string(http::ContentTypeOctetStream);
  }
  return essence;
}

std::optional<std::string> ClientResponse::charset() const {
  const auto raw = _headers.get(http::ContentType);
  if (!raw) {
    return std::nullopt;
  }
  const auto mimetype = http::ParseMimeType(*raw);
  if (auto value = mimetype.parameters.get("charset")) {
    return std::string(*value);
  }
  return std::nullopt;
}

std::optional<std::size_t> ClientResponse::contentLength() const {
  const auto raw = _headers.get(http::ContentLength);
  if (!raw) {
    return std::nullopt;
  }
  const std::string_view value = TrimOws(*raw);
  std::size_t length{};
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
  if (ec != std::errc{} || ptr != value.data() + value.size() || value.empty()) {
    throw std::invalid_argument(fmt::format("Invalid Content-Length '{}'", *raw));
  }
  return length;
}

void ClientResponse::raiseForStatus() {
  if (ok()) {
    return;
  }
  release();
  throw ResponseError(_requestInfo, _history, _status, _reason, _headers);
}

void ClientResponse::release() {
  if (!_released) {
    notifyContent();
  }
  if (_state != State::Closed) {
    _state = State::Released;
  }
  cleanupWriter();
  releaseConnection();
}

void ClientResponse::close() {
  if (!_released) {
    notifyContent();
  }
  _state = State::Closed;
  if (*_schedulerClosed) {
    return;
  }
  cleanupWriter();
  if (_connection) {
    auto connection = std::move(_connection);
    connection->close();
  }
}

async::Task<void> ClientResponse::waitForClose() {
  if (!_writer.empty()) {
    const async::TaskHandle writer = _writer.handle();
    co_await writer.join();
  }
  release();
}

async::Task<std::string_view> ClientResponse::read() {
  if (!_body) {
    if (!_content) {
      throw std::logic_error("Response is not started");
    }
    try {
      std::string body = co_await _content->read();
      _body.emplace(std::move(body));
      for (const auto& trace : _traces) {
        trace->onResponseChunkReceived(_method, _url, *_body);
      }
    } catch (...) {
      close();
      throw;
    }
  } else if (_released) {
    throw ConnectionClosedError();
  }

  Protocol* protocol = _connection ? _connection->protocol() : nullptr;
  if (protocol == nullptr || !protocol->upgraded()) {
    co_await waitReleased();
  }
  co_return std::string_view(*_body);
}

std::string ClientResponse::getEncoding() const {
  const auto mimetype = http::ParseMimeType(ToLower(_headers.getOr(http::ContentType, "")));

  if (auto encoding = mimetype.parameters.get("charset"); encoding && !encoding->empty()) {
    if (auto canonical = LookupCharset(*encoding)) {
      return std::move(*canonical);
    }
  }

  if (mimetype.type == "application" && (mimetype.subtype == "json" || mimetype.subtype == "rdap")) {
    return std::string(kUtf8);
  }

  if (!_body) {
    throw std::logic_error("Cannot compute fallback encoding of a not yet read body");
  }

  return _charsetResolver(*this, *_body);
}

async::Task<std::string> ClientResponse::text(std::optional<std::string> encoding, DecodeErrors errors) {
  if (!_body) {
    co_await read();
  }
  const std::string charset = encoding ? std::move(*encoding) : getEncoding();
  co_return DecodeToUtf8(*_body, charset, errors);
}

void ClientResponse::responseEof() {
  if (_state != State::Open) {
    return;
  }

  Protocol* protocol = _connection ? _connection->protocol() : nullptr;
  if (protocol != nullptr && protocol->upgraded()) {
    return;
  }

  _state = State::Released;
  cleanupWriter();
  releaseConnection();
}

void ClientResponse::releaseConnection() {
  if (!_connection) {
    return;
  }
  if (_writer.empty() || *_schedulerClosed) {
    auto connection = std::move(_connection);
    connection->release();
    return;
  }
  async::TaskHandle writer = _writer.handle();
  writer.addDoneCallback([weakSelf = weak_from_this()](const async::TaskHandle&) {
    if (auto self = weakSelf.lock()) {
      self->releaseConnection();
    }
  });
}

async::Task<void> ClientResponse::waitReleased() {
  if (!_writer.empty()) {
    const async::TaskHandle writer = _writer.handle();
    co_await writer.join();
  }
  releaseConnection();
}

void ClientResponse::cleanupWriter() {
  if (!_writer.empty()) {
    async::TaskHandle writer = _writer.handle();
    writer.cancel();
  }
}

void ClientResponse::notifyContent() {
  if (_content && !_content->exception()) {
    _content->setException(std::make_exception_ptr(ConnectionClosedError()));
  }
  _released = true;
}

}  // namespace courier
