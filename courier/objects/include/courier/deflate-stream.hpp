#pragma once

#include <zlib.h>

#include <cstdint>

namespace courier {

// Compressing z_stream, ended on destruction.
class DeflateStream {
 public:
  enum class Format : int8_t { gzip, deflate };

  // Throws std::runtime_error if zlib refuses the parameters.
  DeflateStream(Format format, int8_t level);

  DeflateStream(const DeflateStream&) = delete;
  DeflateStream(DeflateStream&&) noexcept = delete;
  DeflateStream& operator=(const DeflateStream&) = delete;
  DeflateStream& operator=(DeflateStream&&) noexcept = delete;

  ~DeflateStream();

  [[nodiscard]] z_stream& get() noexcept { return _stream; }

  [[nodiscard]] Format format() const noexcept { return _format; }

 private:
  z_stream _stream{};
  Format _format;
};

}  // namespace courier
