#pragma once

#include <cstddef>
#include <deque>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "courier/content-stream.hpp"
#include "courier/future.hpp"
#include "courier/http-headers.hpp"
#include "courier/http-version.hpp"
#include "courier/protocol.hpp"
#include "courier/task.hpp"
#include "courier/transport-info.hpp"

namespace courier::test {

// Head of a response with its raw header pairs filled from 'headers'.
[[nodiscard]] ResponseHead MakeHead(int status, std::string reason = "OK", const http::Headers& headers = {},
                                    http::Version version = http::HTTP_1_1);

// Scripted Protocol: replays queued response heads, records written bytes.
class FakeProtocol : public Protocol {
 public:
  // Queues a response and returns its payload stream, to be fed by the test.
  std::shared_ptr<ContentStream> pushResponse(ResponseHead head);

  // Queues a failure of read(), for instance an HttpProcessingError.
  void pushError(std::exception_ptr ex);

  async::Task<ReadResult> read() override;

  void write(std::string_view data) override;

  async::Task<void> drain() override;

  void startTimeout() override { ++_nbStartTimeout; }

  [[nodiscard]] bool upgraded() const noexcept override { return _upgraded; }

  [[nodiscard]] const TransportInfo* transport() const noexcept override { return _transport.get(); }

  void setUpgraded(bool upgraded) noexcept { _upgraded = upgraded; }

  void setTransport(std::unique_ptr<TransportInfo> transport) noexcept { _transport = std::move(transport); }

  // write() succeeds 'nbWrites' times, then throws std::system_error with 'ec'.
  void failWritesAfter(std::size_t nbWrites, std::error_code ec = std::make_error_code(std::errc::broken_pipe));

  // Suspends the following drain() calls until openDrain().
  void gateDrain();

  void openDrain();

  [[nodiscard]] bool drainGated() const noexcept { return _drainGate.has_value(); }

  // All bytes written so far.
  [[nodiscard]] const std::string& written() const noexcept { return _written; }

  // Status line and headers, up to the empty line included. Empty if not fully written.
  [[nodiscard]] std::string_view writtenHead() const noexcept;

  // Bytes written after the head.
  [[nodiscard]] std::string_view writtenBody() const noexcept;

  [[nodiscard]] std::size_t nbWrites() const noexcept { return _nbWrites; }
  [[nodiscard]] std::size_t nbDrains() const noexcept { return _nbDrains; }
  [[nodiscard]] std::size_t nbStartTimeout() const noexcept { return _nbStartTimeout; }

 protected:
  void onException() override { wakeReader(); }

 private:
  struct Scripted {
    ReadResult result;
    std::exception_ptr error;
  };

  void wakeReader();

  std::deque<Scripted> _scripted;
  std::optional<async::Future<void>> _readWaiter;
  std::optional<async::Future<void>> _drainGate;
  std::unique_ptr<TransportInfo> _transport;
  std::string _written;
  std::optional<std::size_t> _failAfter;
  std::error_code _failCode;
  std::size_t _nbWrites{};
  std::size_t _nbDrains{};
  std::size_t _nbStartTimeout{};
  bool _upgraded{false};
};

}  // namespace courier::test
