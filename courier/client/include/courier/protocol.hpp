#pragma once

#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "courier/content-stream.hpp"
#include "courier/http-headers.hpp"
#include "courier/http-version.hpp"
#include "courier/task.hpp"
#include "courier/transport-info.hpp"

namespace courier {

// Parsed status line and header section of a response.
struct ResponseHead {
  http::Version version{http::HTTP_1_1};
  int status{};
  std::string reason;
  http::Headers headers;
  // Header fields as received, in order.
  std::vector<std::pair<std::string, std::string>> rawHeaders;
};

struct ReadResult {
  ResponseHead head;
  std::shared_ptr<ContentStream> payload;
};

// Byte level side of a connection: parses response heads, carries request bytes.
// The deferred exception slot records a failure of the request body writer. It is checked before reading a
// response and is propagated to the payload stream currently bound.
class Protocol {
 public:
  Protocol() = default;

  Protocol(const Protocol&) = delete;
  Protocol(Protocol&&) noexcept = delete;
  Protocol& operator=(const Protocol&) = delete;
  Protocol& operator=(Protocol&&) noexcept = delete;

  virtual ~Protocol() = default;

  // Next response head with its payload stream.
  // Throws HttpProcessingError if the head cannot be parsed.
  virtual async::Task<ReadResult> read() = 0;

  virtual void write(std::string_view data) = 0;

  // Waits until the write buffer of the transport is flushed.
  virtual async::Task<void> drain() = 0;

  // Arms the read timeout, once the request is fully sent.
  virtual void startTimeout() = 0;

  // True if the connection switched to another protocol (101 response, CONNECT tunnel).
  [[nodiscard]] virtual bool upgraded() const noexcept = 0;

  // Established transport, nullptr if unknown.
  [[nodiscard]] virtual const TransportInfo* transport() const noexcept = 0;

  void setException(std::exception_ptr ex);

  [[nodiscard]] const std::exception_ptr& exception() const noexcept { return _exception; }

 protected:
  // Payload stream failed together with the protocol.
  void bindPayload(const std::shared_ptr<ContentStream>& payload) { _payload = payload; }

  // Invoked after the exception slot was set, to wake up a pending read for instance.
  virtual void onException() {}

 private:
  std::exception_ptr _exception;
  std::weak_ptr<ContentStream> _payload;
};

}  // namespace courier
