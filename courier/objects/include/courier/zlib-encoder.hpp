#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "courier/deflate-stream.hpp"
#include "courier/encoder.hpp"

namespace courier {

// gzip or deflate request body encoder. An empty chunk finishes the stream.
class ZlibEncoderContext final : public EncoderContext {
 public:
  ZlibEncoderContext(DeflateStream::Format format, int8_t level) : _stream(format, level) {}

  std::string_view encodeChunk(std::size_t encoderChunkSize, std::string_view chunk) override;

 private:
  DeflateStream _stream;
  std::string _out;
};

}  // namespace courier
