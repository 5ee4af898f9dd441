#include "courier/fake-protocol.hpp"

#include <cstddef>
#include <exception>
#include <memory>
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

namespace courier::test {

namespace {
constexpr std::string_view kEndOfHead = "\r\n\r\n";
}  // namespace

ResponseHead MakeHead(int status, std::string reason, const http::Headers& headers, http::Version version) {
  ResponseHead head;
  head.version = version;
  head.status = status;
  head.reason = std::move(reason);
  head.headers = headers;
  for (const auto& [name, value] : headers) {
    head.rawHeaders.emplace_back(name, value);
  }
  return head;
}

std::shared_ptr<ContentStream> FakeProtocol::pushResponse(ResponseHead head) {
  auto payload = std::make_shared<ContentStream>();
  _scripted.push_back(Scripted{ReadResult{std::move(head), payload}, nullptr});
  wakeReader();
  return payload;
}

void FakeProtocol::pushError(std::exception_ptr ex) {
  _scripted.push_back(Scripted{ReadResult{}, std::move(ex)});
  wakeReader();
}

async::Task<ReadResult> FakeProtocol::read() {
  while (_scripted.empty()) {
    if (exception()) {
      std::rethrow_exception(exception());
    }
    if (!_readWaiter) {
      _readWaiter.emplace();
    }
    async::Future<void> waiter = *_readWaiter;
    co_await waiter;
  }
  Scripted next = std::move(_scripted.front());
  _scripted.pop_front();
  if (next.error) {
    std::rethrow_exception(next.error);
  }
  bindPayload(next.result.payload);
  co_return std::move(next.result);
}

void FakeProtocol::write(std::string_view data) {
  if (_failAfter && _nbWrites >= *_failAfter) {
    throw std::system_error(_failCode, "write failed");
  }
  ++_nbWrites;
  _written.append(data);
}

async::Task<void> FakeProtocol::drain() {
  ++_nbDrains;
  if (_drainGate) {
    async::Future<void> gate = *_drainGate;
    co_await gate;
  }
}

void FakeProtocol::failWritesAfter(std::size_t nbWrites, std::error_code ec) {
  _failAfter = nbWrites;
  _failCode = ec;
}

void FakeProtocol::gateDrain() {
  if (!_drainGate) {
    _drainGate.emplace();
  }
}

void FakeProtocol::openDrain() {
  if (_drainGate) {
    async::Future<void> gate = std::move(*_drainGate);
    _drainGate.reset();
    gate.setResult();
  }
}

std::string_view FakeProtocol::writtenHead() const noexcept {
  const auto pos = _written.find(kEndOfHead);
  if (pos == std::string::npos) {
    return {};
  }
  return std::string_view(_written).substr(0, pos + kEndOfHead.size());
}

std::string_view FakeProtocol::writtenBody() const noexcept {
  const auto pos = _written.find(kEndOfHead);
  if (pos == std::string::npos) {
    return {};
  }
  return std::string_view(_written).substr(pos + kEndOfHead.size());
}

void FakeProtocol::wakeReader() {
  if (_readWaiter) {
    async::Future<void> waiter = std::move(*_readWaiter);
    _readWaiter.reset();
    waiter.setResult();
  }
}

}  // namespace courier::test
