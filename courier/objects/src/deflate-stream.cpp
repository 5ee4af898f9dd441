#include "courier/deflate-stream.hpp"

#include <fmt/format.h>
#include <zconf.h>
#include <zlib.h>

#include <cstdint>
#include <stdexcept>

#include "courier/log.hpp"

namespace courier {

namespace {

// 16 added to the window bits asks zlib for a gzip wrapper instead of the zlib one.
constexpr int kGzipWrapper = 16;
constexpr int kMemLevel = 8;

}  // namespace

DeflateStream::DeflateStream(Format format, int8_t level) : _format(format) {
  const int windowBits = format == Format::gzip ? MAX_WBITS + kGzipWrapper : MAX_WBITS;
  const int ret = ::deflateInit2(&_stream, level, Z_DEFLATED, windowBits, kMemLevel, Z_DEFAULT_STRATEGY);
  if (ret != Z_OK) {
    throw std::runtime_error(fmt::format("deflateInit2 failed with code {} for level {}", ret, level));
  }
}

DeflateStream::~DeflateStream() {
  // An unfinished stream (request cancelled mid-body) reports Z_DATA_ERROR.
  if (const int ret = ::deflateEnd(&_stream); ret != Z_OK && ret != Z_DATA_ERROR) {
    log::error("deflateEnd returned {}", ret);
  }
}

}  // namespace courier
