#pragma once

#include <brotli/encode.h>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include "courier/encoder.hpp"

namespace courier {

// Streaming brotli request body encoder. An empty chunk finishes the stream.
class BrotliEncoderContext final : public EncoderContext {
 public:
  BrotliEncoderContext(int quality, int window);

  std::string_view encodeChunk(std::size_t encoderChunkSize, std::string_view chunk) override;

 private:
  struct StateDeleter {
    void operator()(BrotliEncoderState *state) const noexcept { BrotliEncoderDestroyInstance(state); }
  };

  [[nodiscard]] bool done(bool finishing, std::size_t availIn) const;

  void setParameter(BrotliEncoderParameter param, int value, const char *name);

  std::unique_ptr<BrotliEncoderState, StateDeleter> _state;
  std::string _out;
};

}  // namespace courier
