#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "courier/charset.hpp"
#include "courier/connection.hpp"
#include "courier/content-disposition.hpp"
#include "courier/content-stream.hpp"
#include "courier/cookies.hpp"
#include "courier/future.hpp"
#include "courier/http-constants.hpp"
#include "courier/http-headers.hpp"
#include "courier/http-version.hpp"
#include "courier/link-header.hpp"
#include "courier/mime-type.hpp"
#include "courier/request-info.hpp"
#include "courier/request-options.hpp"
#include "courier/response-error.hpp"
#include "courier/scheduler.hpp"
#include "courier/task-slot.hpp"
#include "courier/task.hpp"
#include "courier/trace.hpp"
#include "courier/url.hpp"

namespace courier {

struct JsonOptions {
  // Charset of the body, deduced from the response when absent.
  std::optional<std::string> encoding;
  // Media type the response must have. Empty disables the check.
  std::string contentType{http::ContentTypeApplicationJson};
};

// Response of a ClientRequest, owning the reservation of its connection.
// The connection goes back to the pool alive when the payload has been fully received or on release(), and is
// closed by close(). It is never handed back while the body writer of the request is still running.
// Instances are shared: they are created by ClientRequest::send() with std::make_shared.
class ClientResponse : public std::enable_shared_from_this<ClientResponse> {
 public:
  enum class State : std::uint8_t { Unstarted, Open, Released, Closed };

  ClientResponse(std::string method, const Url& url, async::TaskHandle writer,
                 std::optional<async::Future<bool>> continue100, RequestInfo requestInfo, Traces traces,
                 async::Scheduler& scheduler, CharsetResolver charsetResolver = {});

  ClientResponse(const ClientResponse&) = delete;
  ClientResponse(ClientResponse&&) noexcept = delete;
  ClientResponse& operator=(const ClientResponse&) = delete;
  ClientResponse& operator=(ClientResponse&&) noexcept = delete;

  // Warns about an open response, cancels the writer, and releases the connection once the writer is done.
  ~ClientResponse();

  // Reads the response head, skipping informational responses other than 101.
  // Throws the error stored in the protocol by a failed body writer, or ResponseError for an unparsable head.
  async::Task<void> start(std::shared_ptr<Connection> connection);

  [[nodiscard]] const std::string& method() const noexcept { return _method; }

  // URL of the request, without fragment.
  [[nodiscard]] const Url& url() const noexcept { return _url; }

  [[nodiscard]] const Url& realUrl() const noexcept { return _realUrl; }

  [[nodiscard]] const std::string& host() const noexcept { return _url.rawHost(); }

  [[nodiscard]] http::Version version() const noexcept { return _version; }
  [[nodiscard]] int status() const noexcept { return _status; }
  [[nodiscard]] const std::string& reason() const noexcept { return _reason; }

  [[nodiscard]] const http::Headers& headers() const noexcept { return _headers; }

  [[nodiscard]] const std::vector<std::pair<std::string, std::string>>& rawHeaders() const noexcept {
    return _rawHeaders;
  }

  // Payload stream, nullptr before start().
  [[nodiscard]] const std::shared_ptr<ContentStream>& content() const noexcept { return _content; }

  [[nodiscard]] const Cookies& cookies() const noexcept { return _cookies; }

  [[nodiscard]] const std::optional<http::ContentDisposition>& contentDisposition() const noexcept {
    return _contentDisposition;
  }

  [[nodiscard]] const std::vector<http::Link>& links() const noexcept { return _links; }

  [[nodiscard]] const RequestInfo& requestInfo() const noexcept { return _requestInfo; }

  [[nodiscard]] const ResponseHistory& history() const noexcept { return _history; }

  // Records the responses of the redirects that led to this one.
  // Throws std::logic_error if the history was already set.
  void setHistory(ResponseHistory history);

  // Connection still reserved by this response, nullptr once released or closed.
  [[nodiscard]] const std::shared_ptr<Connection>& connection() const noexcept { return _connection; }

  [[nodiscard]] State state() const noexcept { return _state; }

  [[nodiscard]] bool closed() const noexcept { return _state != State::Open; }

  // Media type of the body without parameters, application/octet-stream by default.
  [[nodiscard]] std::string contentType() const;

  // charset parameter of the Content-Type header.
  [[nodiscard]] std::optional<std::string> charset() const;

  // Throws std::invalid_argument for a Content-Length that is not a number.
  [[nodiscard]] std::optional<std::size_t> contentLength() const;

  // True for a status lower than 400.
  [[nodiscard]] bool ok() const noexcept { return _status < 400; }

  // Releases the response and throws ResponseError if the status is 400 or more.
  void raiseForStatus();

  // Fails the unread content with ConnectionClosedError and hands the connection back to its pool.
  void release();

  // Fails the unread content with ConnectionClosedError and closes the connection.
  void close();

  // Waits for the body writer, then releases.
  async::Task<void> waitForClose();

  // Whole body, read once and cached.
  // Throws ConnectionClosedError if the response was released. The response is closed if reading fails.
  async::Task<std::string_view> read();

  // Charset of the body: Content-Type charset, utf-8 for JSON media types, or the charset resolver.
  // Throws std::logic_error when the resolver is needed and the body was not read yet.
  [[nodiscard]] std::string getEncoding() const;

  // Body decoded to UTF-8.
  async::Task<std::string> text(std::optional<std::string> encoding = std::nullopt,
                                DecodeErrors errors = DecodeErrors::Strict);

  // Decodes the body with 'loads', which is called with the UTF-8 text.
  // Throws ContentTypeMismatch if the media type does not match options.contentType.
  template <class Loads>
  async::Task<std::invoke_result_t<Loads&, std::string_view>> json(Loads loads, JsonOptions options = {});

 private:
  void responseEof();

  void releaseConnection();

  async::Task<void> waitReleased();

  void cleanupWriter();

  void notifyContent();

  std::string _method;
  Url _url;
  Url _realUrl;
  RequestInfo _requestInfo;
  Traces _traces;
  CharsetResolver _charsetResolver;
  std::optional<async::Future<bool>> _continue;
  std::shared_ptr<const bool> _schedulerClosed;
  async::TaskSlot _writer;
  std::shared_ptr<Connection> _connection;
  std::shared_ptr<ContentStream> _content;
  http::Headers _headers;
  std::vector<std::pair<std::string, std::string>> _rawHeaders;
  std::string _reason;
  Cookies _cookies;
  std::optional<http::ContentDisposition> _contentDisposition;
  std::vector<http::Link> _links;
  std::optional<std::string> _body;
  ResponseHistory _history;
  http::Version _version;
  int _status{};
  State _state{State::Unstarted};
  bool _released{false};
  bool _historySet{false};
};

template <class Loads>
async::Task<std::invoke_result_t<Loads&, std::string_view>> ClientResponse::json(Loads loads, JsonOptions options) {
  if (!_body) {
    co_await read();
  }
  if (!options.contentType.empty()) {
    const std::string actual = contentType();
    if (!http::IsExpectedContentType(actual, options.contentType)) {
      throw ContentTypeMismatch(_requestInfo, _history, _status,
                                fmt::format("Attempt to decode JSON with unexpected mimetype: {}", actual), _headers);
    }
  }
  const std::string encoding = options.encoding ? *options.encoding : getEncoding();
  const std::string text = DecodeToUtf8(*_body, encoding);
  co_return loads(std::string_view(text));
}

}  // namespace courier
