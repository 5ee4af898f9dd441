#include "courier/brotli-encoder.hpp"

#include <brotli/encode.h>
#include <brotli/types.h>
#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <new>
#include <stdexcept>
#include <string_view>

namespace courier {

BrotliEncoderContext::BrotliEncoderContext(int quality, int window)
    : _state(BrotliEncoderCreateInstance(nullptr, nullptr, nullptr)) {
  if (!_state) {
    throw std::bad_alloc();
  }
  setParameter(BROTLI_PARAM_QUALITY, quality, "quality");
  setParameter(BROTLI_PARAM_LGWIN, window, "window");
}

void BrotliEncoderContext::setParameter(BrotliEncoderParameter param, int value, const char *name) {
  if (BrotliEncoderSetParameter(_state.get(), param, static_cast<uint32_t>(value)) == BROTLI_FALSE) {
    throw std::invalid_argument(fmt::format("Invalid brotli {} {}", name, value));
  }
}

bool BrotliEncoderContext::done(bool finishing, std::size_t availIn) const {
  if (finishing) {
    return BrotliEncoderIsFinished(_state.get()) == BROTLI_TRUE;
  }
  return availIn == 0 && BrotliEncoderHasMoreOutput(_state.get()) == BROTLI_FALSE;
}

std::string_view BrotliEncoderContext::encodeChunk(std::size_t encoderChunkSize, std::string_view chunk) {
  const bool finishing = chunk.empty();
  const auto op = finishing ? BROTLI_OPERATION_FINISH : BROTLI_OPERATION_PROCESS;
  const auto *nextIn = reinterpret_cast<const uint8_t *>(chunk.data());
  std::size_t availIn = chunk.size();

  _out.clear();
  do {
    const std::size_t produced = _out.size();
    _out.resize(produced + encoderChunkSize);
    auto *nextOut = reinterpret_cast<uint8_t *>(_out.data() + produced);
    std::size_t availOut = encoderChunkSize;

    const auto ok = BrotliEncoderCompressStream(_state.get(), op, &availIn, &nextIn, &availOut, &nextOut, nullptr);
    _out.resize(produced + encoderChunkSize - availOut);
    if (ok == BROTLI_FALSE) {
      throw std::runtime_error("brotli compression failed");
    }
  } while (!done(finishing, availIn));
  return _out;
}

}  // namespace courier
