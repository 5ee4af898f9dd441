#include "courier/compression-config.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

#include "courier/features.hpp"

namespace courier {

TEST(CompressionConfig, DefaultIsValid) { EXPECT_NO_THROW(CompressionConfig{}.validate()); }

TEST(CompressionConfig, ZeroChunkSize) {
  CompressionConfig cfg;
  cfg.encoderChunkSize = 0;
  EXPECT_THROW(cfg.validate(), std::invalid_argument);
}

TEST(CompressionConfig, ZlibLevelRange) {
  if constexpr (!zlibEnabled()) {
    GTEST_SKIP() << "zlib disabled";
  }
  CompressionConfig cfg;
  cfg.zlib.level = CompressionConfig::Zlib::kMaxLevel;
  EXPECT_NO_THROW(cfg.validate());
  cfg.zlib.level = CompressionConfig::Zlib::kMaxLevel + 1;
  EXPECT_THROW(cfg.validate(), std::invalid_argument);
}

TEST(CompressionConfig, BrotliRanges) {
  if constexpr (!brotliEnabled()) {
    GTEST_SKIP() << "brotli disabled";
  }
  CompressionConfig cfg;
  cfg.brotli.quality = CompressionConfig::Brotli::kMaxQuality + 1;
  EXPECT_THROW(cfg.validate(), std::invalid_argument);
  cfg.brotli.quality = CompressionConfig::Brotli::kMinQuality;
  cfg.brotli.window = CompressionConfig::Brotli::kMinWindow - 1;
  EXPECT_THROW(cfg.validate(), std::invalid_argument);
}

}  // namespace courier
