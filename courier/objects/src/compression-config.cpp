#include "courier/compression-config.hpp"

#include <fmt/format.h>

#include <stdexcept>

#include "courier/features.hpp"

namespace courier {

void CompressionConfig::validate() const {
  if (encoderChunkSize == 0) {
    throw std::invalid_argument("Invalid encoder chunk size");
  }
  if constexpr (zlibEnabled()) {
    if (zlib.level != Zlib::kDefaultLevel && (zlib.level < Zlib::kMinLevel || zlib.level > Zlib::kMaxLevel)) {
      throw std::invalid_argument(fmt::format("Invalid ZLIB compression level {}", zlib.level));
    }
  }
  if constexpr (brotliEnabled()) {
    if (brotli.quality < Brotli::kMinQuality || brotli.quality > Brotli::kMaxQuality) {
      throw std::invalid_argument(fmt::format("Invalid Brotli quality {}", brotli.quality));
    }
    if (brotli.window < Brotli::kMinWindow || brotli.window > Brotli::kMaxWindow) {
      throw std::invalid_argument(fmt::format("Invalid Brotli window {}", brotli.window));
    }
  }
}

}  // namespace courier
