#pragma once

#include <cstddef>
#include <cstdint>

#ifdef COURIER_ENABLE_ZLIB
#include <zlib.h>
#endif

#ifdef COURIER_ENABLE_BROTLI
#include <brotli/encode.h>
#endif

namespace courier {

// Compression is optional at build time. When a codec is not compiled in, its settings are ignored by validate()
// and selecting it for a request body throws std::invalid_argument.
struct CompressionConfig {
  // Throws std::invalid_argument for out of range settings.
  void validate() const;

  struct Zlib {
#ifdef COURIER_ENABLE_ZLIB
    static constexpr int8_t kDefaultLevel = Z_DEFAULT_COMPRESSION;
    static constexpr int8_t kMinLevel = Z_BEST_SPEED;
    static constexpr int8_t kMaxLevel = Z_BEST_COMPRESSION;
#else
    static constexpr int8_t kDefaultLevel = 0;
    static constexpr int8_t kMinLevel = 0;
    static constexpr int8_t kMaxLevel = 0;
#endif
    int8_t level = kDefaultLevel;
  } zlib;

  struct Brotli {
#ifdef COURIER_ENABLE_BROTLI
    static constexpr int8_t kDefaultQuality = BROTLI_DEFAULT_QUALITY;
    static constexpr int8_t kDefaultWindow = BROTLI_DEFAULT_WINDOW;
    static constexpr int8_t kMinQuality = BROTLI_MIN_QUALITY;
    static constexpr int8_t kMaxQuality = BROTLI_MAX_QUALITY;
    static constexpr int8_t kMinWindow = BROTLI_MIN_WINDOW_BITS;
    static constexpr int8_t kMaxWindow = BROTLI_MAX_WINDOW_BITS;
#else
    static constexpr int8_t kDefaultQuality = 0;
    static constexpr int8_t kDefaultWindow = 0;
    static constexpr int8_t kMinQuality = 0;
    static constexpr int8_t kMaxQuality = 0;
    static constexpr int8_t kMinWindow = 0;
    static constexpr int8_t kMaxWindow = 0;
#endif
    int8_t quality = kDefaultQuality;
    int8_t window = kDefaultWindow;
  } brotli;

  // Chunk size of buffer growths during compression.
  std::size_t encoderChunkSize{16UL * 1024UL};
};

}  // namespace courier
