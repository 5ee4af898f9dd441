#pragma once

#include <cstddef>
#include <memory>
#include <string_view>

#include "courier/compression-config.hpp"
#include "courier/encoding.hpp"

namespace courier {

// Stateful streaming compressor.
// Lifecycle: encodeChunk(data)* then encodeChunk({}) to finish the stream. The returned view is valid until the
// next call on the same context.
class EncoderContext {
 public:
  virtual ~EncoderContext() = default;

  // Streaming chunk encoder. If 'data' is empty, it will be considered as a finish.
  virtual std::string_view encodeChunk(std::size_t encoderChunkSize, std::string_view data) = 0;
};

// Creates a streaming context for 'encoding'.
// Throws std::invalid_argument if the codec is not compiled in.
[[nodiscard]] std::unique_ptr<EncoderContext> MakeEncoderContext(Encoding encoding, const CompressionConfig& cfg);

}  // namespace courier
