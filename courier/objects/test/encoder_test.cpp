#include "courier/encoder.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include "courier/compression-config.hpp"
#include "courier/encoding.hpp"
#include "courier/features.hpp"

#ifdef COURIER_ENABLE_ZLIB
#include <zlib.h>
#endif

#ifdef COURIER_ENABLE_BROTLI
#include <brotli/decode.h>
#endif

namespace courier {

namespace {

std::string MakePayload() {
  std::string payload;
  for (int idx = 0; idx < 4000; ++idx) {
    payload.append("courier streaming payload line ");
    payload.append(std::to_string(idx));
    payload.push_back('\n');
  }
  return payload;
}

// Feeds 'payload' in pieces of 'pieceSize' bytes then finishes the stream.
std::string EncodeAll(EncoderContext& ctx, std::string_view payload, std::size_t pieceSize) {
  std::string out;
  for (std::size_t pos = 0; pos < payload.size(); pos += pieceSize) {
    out.append(ctx.encodeChunk(1024, payload.substr(pos, pieceSize)));
  }
  out.append(ctx.encodeChunk(1024, {}));
  return out;
}

#ifdef COURIER_ENABLE_ZLIB
std::string Inflate(std::string_view data) {
  z_stream zs{};
  // 32 enables automatic zlib / gzip header detection.
  if (inflateInit2(&zs, MAX_WBITS + 32) != Z_OK) {
    throw std::runtime_error("inflateInit2 failed");
  }
  zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  zs.avail_in = static_cast<uInt>(data.size());
  std::string out;
  int ret = Z_OK;
  while (ret != Z_STREAM_END) {
    char buf[4096];
    zs.next_out = reinterpret_cast<Bytef*>(buf);
    zs.avail_out = sizeof(buf);
    ret = inflate(&zs, Z_NO_FLUSH);
    if (ret != Z_OK && ret != Z_STREAM_END) {
      inflateEnd(&zs);
      throw std::runtime_error("inflate failed");
    }
    out.append(buf, sizeof(buf) - zs.avail_out);
  }
  inflateEnd(&zs);
  return out;
}
#endif

}  // namespace

TEST(Encoder, GzipStreaming) {
  if constexpr (!zlibEnabled()) {
    GTEST_SKIP() << "zlib disabled";
  }
#ifdef COURIER_ENABLE_ZLIB
  const auto payload = MakePayload();
  auto ctx = MakeEncoderContext(Encoding::gzip, CompressionConfig{});
  const auto encoded = EncodeAll(*ctx, payload, 1000);
  ASSERT_GE(encoded.size(), 2U);
  EXPECT_EQ(static_cast<uint8_t>(encoded[0]), 0x1FU);
  EXPECT_EQ(static_cast<uint8_t>(encoded[1]), 0x8BU);
  EXPECT_LT(encoded.size(), payload.size());
  EXPECT_EQ(Inflate(encoded), payload);
#endif
}

TEST(Encoder, DeflateStreaming) {
  if constexpr (!zlibEnabled()) {
    GTEST_SKIP() << "zlib disabled";
  }
#ifdef COURIER_ENABLE_ZLIB
  const auto payload = MakePayload();
  auto ctx = MakeEncoderContext(Encoding::deflate, CompressionConfig{});
  EXPECT_EQ(Inflate(EncodeAll(*ctx, payload, 333)), payload);
#endif
}

TEST(Encoder, EmptyStreamIsStillValid) {
  if constexpr (!zlibEnabled()) {
    GTEST_SKIP() << "zlib disabled";
  }
#ifdef COURIER_ENABLE_ZLIB
  auto ctx = MakeEncoderContext(Encoding::gzip, CompressionConfig{});
  const std::string encoded(ctx->encodeChunk(64, {}));
  EXPECT_FALSE(encoded.empty());
  EXPECT_EQ(Inflate(encoded), "");
#endif
}

TEST(Encoder, BrotliStreaming) {
  if constexpr (!brotliEnabled()) {
    GTEST_SKIP() << "brotli disabled";
  }
#ifdef COURIER_ENABLE_BROTLI
  const auto payload = MakePayload();
  auto ctx = MakeEncoderContext(Encoding::br, CompressionConfig{});
  const auto encoded = EncodeAll(*ctx, payload, 4096);
  EXPECT_LT(encoded.size(), payload.size());

  std::string decoded(payload.size(), '\0');
  std::size_t decodedSize = decoded.size();
  ASSERT_EQ(BrotliDecoderDecompress(encoded.size(), reinterpret_cast<const uint8_t*>(encoded.data()), &decodedSize,
                                    reinterpret_cast<uint8_t*>(decoded.data())),
            BROTLI_DECODER_RESULT_SUCCESS);
  decoded.resize(decodedSize);
  EXPECT_EQ(decoded, payload);
#endif
}

TEST(Encoder, DisabledCodecThrows) {
  if constexpr (brotliEnabled()) {
    GTEST_SKIP() << "brotli enabled";
  }
  EXPECT_THROW((void)MakeEncoderContext(Encoding::br, CompressionConfig{}), std::invalid_argument);
}

}  // namespace courier
