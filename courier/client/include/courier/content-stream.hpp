#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "courier/future.hpp"
#include "courier/task.hpp"

namespace courier {

// Buffered payload stream of a response, fed by the protocol and consumed by the client.
// A pending read is woken up by feedData(), feedEof() or setException(). Once set, the exception is raised by every
// read, even if data is still buffered.
class ContentStream {
 public:
  using EofCallback = std::function<void()>;

  ContentStream() = default;

  ContentStream(const ContentStream&) = delete;
  ContentStream(ContentStream&&) noexcept = delete;
  ContentStream& operator=(const ContentStream&) = delete;
  ContentStream& operator=(ContentStream&&) noexcept = delete;

  ~ContentStream() = default;

  // Throws std::logic_error if EOF was already fed.
  void feedData(std::string_view data);

  // Marks the end of the payload and runs the EOF callbacks. Subsequent calls have no effect.
  void feedEof();

  void setException(std::exception_ptr ex);

  [[nodiscard]] const std::exception_ptr& exception() const noexcept { return _exception; }

  // True if the protocol fed the end of the payload.
  [[nodiscard]] bool isEof() const noexcept { return _eof; }

  // True if the end of the payload was fed and all data consumed.
  [[nodiscard]] bool atEof() const noexcept { return _eof && _buffer.empty(); }

  // Registers a callback invoked once when EOF is fed, or immediately if it already was.
  void onEof(EofCallback callback);

  [[nodiscard]] std::size_t bufferedSize() const noexcept { return _buffer.size(); }

  // Total number of bytes fed so far.
  [[nodiscard]] std::size_t totalBytes() const noexcept { return _totalBytes; }

  // Reads everything until EOF.
  async::Task<std::string> read();

  // Reads at most 'maxSize' bytes, waiting for data if none is buffered. Returns an empty string at EOF.
  async::Task<std::string> readChunk(std::size_t maxSize);

 private:
  async::Task<void> waitForData();

  void wakeWaiter();

  void throwIfFailed() const;

  std::string _buffer;
  std::optional<async::Future<void>> _waiter;
  std::exception_ptr _exception;
  std::vector<EofCallback> _eofCallbacks;
  std::size_t _totalBytes{};
  bool _eof{false};
};

}  // namespace courier
