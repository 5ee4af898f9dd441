#include "courier/stream-writer.hpp"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "courier/compression-config.hpp"
#include "courier/encoder.hpp"
#include "courier/encoding.hpp"
#include "courier/http-constants.hpp"
#include "courier/http-headers.hpp"
#include "courier/log.hpp"
#include "courier/task.hpp"

namespace courier {

namespace {

constexpr std::string_view kLastChunk = "0\r\n\r\n";
constexpr std::string_view kHeaderSep = ": ";

}  // namespace

StreamWriter::StreamWriter(Protocol& protocol, ChunkCallback onChunkSent, HeadersCallback onHeadersSent)
    : _protocol(&protocol), _onChunkSent(std::move(onChunkSent)), _onHeadersSent(std::move(onHeadersSent)) {}

void StreamWriter::enableCompression(Encoding encoding, const CompressionConfig& config) {
  config.validate();
  _encoder = MakeEncoderContext(encoding, config);
  _encoderChunkSize = config.encoderChunkSize;
}

void StreamWriter::writeHeaders(std::string_view statusLine, const http::Headers& headers) {
  if (statusLine.find_first_of("\r\n") != std::string_view::npos) {
    throw std::invalid_argument("Newline or carriage return character detected in status line");
  }
  std::size_t size = statusLine.size() + 2U * http::CRLF.size();
  for (const auto& [name, value] : headers) {
    http::ValidateHeader(name, value);
    size += name.size() + kHeaderSep.size() + value.size() + http::CRLF.size();
  }

  if (_onHeadersSent) {
    _onHeadersSent(headers);
  }

  std::string buf;
  buf.reserve(size);
  buf.append(statusLine);
  buf.append(http::CRLF);
  for (const auto& [name, value] : headers) {
    buf.append(name);
    buf.append(kHeaderSep);
    buf.append(value);
    buf.append(http::CRLF);
  }
  buf.append(http::CRLF);
  emit(buf);
  _state = State::HeadersSent;
}

async::Task<void> StreamWriter::write(std::string_view data, bool drain) {
  if (_state == State::Ended) {
    throw std::logic_error("Cannot write body data after writeEof");
  }
  if (_onChunkSent) {
    _onChunkSent(data);
  }
  if (data.empty()) {
    co_return;
  }
  if (_encoder) {
    data = _encoder->encodeChunk(_encoderChunkSize, data);
    if (data.empty()) {
      co_return;
    }
  }
  if (_chunked) {
    std::string framed;
    AppendChunk(framed, data);
    emit(framed);
  } else {
    emit(data);
  }
  if (drain && _bufferSize > kWriteBufferLimit) {
    _bufferSize = 0;
    co_await _protocol->drain();
  }
}

async::Task<void> StreamWriter::writeEof(std::string_view data) {
  if (_state == State::Ended) {
    co_return;
  }
  if (!data.empty() && _onChunkSent) {
    _onChunkSent(data);
  }

  std::string body;
  if (_encoder) {
    if (!data.empty()) {
      body.append(_encoder->encodeChunk(_encoderChunkSize, data));
    }
    body.append(_encoder->encodeChunk(_encoderChunkSize, {}));
  } else {
    body.append(data);
  }

  if (_chunked) {
    std::string framed;
    if (!body.empty()) {
      AppendChunk(framed, body);
    }
    framed.append(kLastChunk);
    emit(framed);
  } else if (!body.empty()) {
    emit(body);
  }

  _state = State::Ended;
  log::trace("Request body ended, {} bytes written, chunked={}", _outputSize, _chunked);
  co_await _protocol->drain();
}

async::Task<void> StreamWriter::drain() { co_await _protocol->drain(); }

void StreamWriter::emit(std::string_view data) {
  _protocol->write(data);
  _bufferSize += data.size();
  _outputSize += data.size();
}

void StreamWriter::AppendChunk(std::string& out, std::string_view data) {
  // enough for a 64-bit length in hex
  static constexpr std::size_t kMaxHexLen = 2UL * sizeof(uint64_t);

  char hex[kMaxHexLen];
  const auto res = std::to_chars(hex, hex + kMaxHexLen, static_cast<uint64_t>(data.size()), 16);
  out.reserve(out.size() + static_cast<std::size_t>(res.ptr - hex) + data.size() + 2U * http::CRLF.size());
  out.append(hex, res.ptr);
  out.append(http::CRLF);
  out.append(data);
  out.append(http::CRLF);
}

}  // namespace courier
