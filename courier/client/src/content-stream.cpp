#include "courier/content-stream.hpp"

#include <algorithm>
#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "courier/future.hpp"
#include "courier/log.hpp"
#include "courier/task.hpp"

namespace courier {

namespace {

void RunEofCallback(const ContentStream::EofCallback& callback) {
  try {
    callback();
  } catch (const std::exception& ex) {
    log::error("Exception in eof callback: {}", ex.what());
  }
}

}  // namespace

void ContentStream::feedData(std::string_view data) {
  if (_eof) {
    throw std::logic_error("feedData called after feedEof");
  }
  if (data.empty()) {
    return;
  }
  _buffer.append(data);
  _totalBytes += data.size();
  wakeWaiter();
}

void ContentStream::feedEof() {
  if (_eof) {
    return;
  }
  _eof = true;
  wakeWaiter();
  auto callbacks = std::move(_eofCallbacks);
  _eofCallbacks.clear();
  for (const auto& callback : callbacks) {
    RunEofCallback(callback);
  }
}

void ContentStream::setException(std::exception_ptr ex) {
  _exception = std::move(ex);
  wakeWaiter();
}

void ContentStream::onEof(EofCallback callback) {
  if (_eof) {
    RunEofCallback(callback);
  } else {
    _eofCallbacks.push_back(std::move(callback));
  }
}

async::Task<std::string> ContentStream::read() {
  std::string out;
  for (;;) {
    throwIfFailed();
    if (_buffer.empty() && _eof) {
      break;
    }
    if (_buffer.empty()) {
      co_await waitForData();
      continue;
    }
    if (out.empty()) {
      out.swap(_buffer);
    } else {
      out.append(_buffer);
      _buffer.clear();
    }
  }
  co_return out;
}

async::Task<std::string> ContentStream::readChunk(std::size_t maxSize) {
  throwIfFailed();
  while (_buffer.empty() && !_eof) {
    co_await waitForData();
    throwIfFailed();
  }
  const std::size_t size = std::min(maxSize, _buffer.size());
  std::string out = _buffer.substr(0, size);
  _buffer.erase(0, size);
  co_return out;
}

async::Task<void> ContentStream::waitForData() {
  if (!_waiter) {
    _waiter.emplace();
  }
  // Copy: the slot is emptied by the producer before waking.
  async::Future<void> waiter = *_waiter;
  co_await waiter;
}

void ContentStream::wakeWaiter() {
  if (_waiter) {
    async::Future<void> waiter = std::move(*_waiter);
    _waiter.reset();
    waiter.setResult();
  }
}

void ContentStream::throwIfFailed() const {
  if (_exception) {
    std::rethrow_exception(_exception);
  }
}

}  // namespace courier
