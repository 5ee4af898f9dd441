#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string_view>

#include "courier/compression-config.hpp"
#include "courier/encoder.hpp"
#include "courier/encoding.hpp"
#include "courier/http-headers.hpp"
#include "courier/protocol.hpp"
#include "courier/task.hpp"

namespace courier {

// Serializes a request onto a Protocol: status line and headers, then the body with optional compression and
// chunked framing.
class StreamWriter {
 public:
  // Buffered bytes above which write() waits for the protocol to drain.
  static constexpr std::size_t kWriteBufferLimit = 64UL * 1024UL;

  using ChunkCallback = std::function<void(std::string_view)>;
  using HeadersCallback = std::function<void(const http::Headers&)>;

  explicit StreamWriter(Protocol& protocol, ChunkCallback onChunkSent = {}, HeadersCallback onHeadersSent = {});

  void enableChunking() noexcept { _chunked = true; }

  // Throws std::invalid_argument if the codec is not available in this build.
  void enableCompression(Encoding encoding, const CompressionConfig& config = {});

  [[nodiscard]] bool chunked() const noexcept { return _chunked; }

  [[nodiscard]] bool compressing() const noexcept { return static_cast<bool>(_encoder); }

  // Writes the status line followed by the header fields and the empty line.
  // Throws std::invalid_argument, before writing anything, for a field or a status line containing CR or LF.
  void writeHeaders(std::string_view statusLine, const http::Headers& headers);

  // Writes a body chunk. 'data' must stay valid until the returned task completes.
  async::Task<void> write(std::string_view data, bool drain = true);

  // Writes the last body bytes, flushes the compressor and terminates the chunked body, then drains.
  // The body counts as ended before the final drain: later calls have no effect.
  async::Task<void> writeEof(std::string_view data = {});

  async::Task<void> drain();

  // Bytes written since the last drain triggered by write().
  [[nodiscard]] std::size_t bufferSize() const noexcept { return _bufferSize; }

  // Total bytes written to the protocol.
  [[nodiscard]] std::size_t outputSize() const noexcept { return _outputSize; }

  [[nodiscard]] bool eof() const noexcept { return _state == State::Ended; }

 private:
  enum class State : std::uint8_t { Opened, HeadersSent, Ended };

  void emit(std::string_view data);

  // Appends 'data' to 'out' in chunked framing.
  static void AppendChunk(std::string& out, std::string_view data);

  Protocol* _protocol;
  ChunkCallback _onChunkSent;
  HeadersCallback _onHeadersSent;
  std::unique_ptr<EncoderContext> _encoder;
  std::size_t _encoderChunkSize{};
  std::size_t _bufferSize{};
  std::size_t _outputSize{};
  State _state{State::Opened};
  bool _chunked{false};
};

}  // namespace courier
