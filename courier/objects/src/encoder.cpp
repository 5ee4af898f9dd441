#include "courier/encoder.hpp"

#include <fmt/format.h>

#include <memory>
#include <stdexcept>

#include "courier/compression-config.hpp"
#include "courier/encoding.hpp"

#ifdef COURIER_ENABLE_ZLIB
#include "courier/zlib-encoder.hpp"
#endif

#ifdef COURIER_ENABLE_BROTLI
#include "courier/brotli-encoder.hpp"
#endif

namespace courier {

std::unique_ptr<EncoderContext> MakeEncoderContext(Encoding encoding, [[maybe_unused]] const CompressionConfig& cfg) {
  switch (encoding) {
#ifdef COURIER_ENABLE_ZLIB
    case Encoding::deflate:
      return std::make_unique<ZlibEncoderContext>(DeflateStream::Format::deflate, cfg.zlib.level);
    case Encoding::gzip:
      return std::make_unique<ZlibEncoderContext>(DeflateStream::Format::gzip, cfg.zlib.level);
#endif
#ifdef COURIER_ENABLE_BROTLI
    case Encoding::br:
      return std::make_unique<BrotliEncoderContext>(cfg.brotli.quality, cfg.brotli.window);
#endif
    default:
      break;
  }
  throw std::invalid_argument(fmt::format("Unsupported content encoding '{}' in this build", GetEncodingStr(encoding)));
}

}  // namespace courier
