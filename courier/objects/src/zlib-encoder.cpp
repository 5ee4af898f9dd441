#include "courier/zlib-encoder.hpp"

#include <fmt/format.h>
#include <zconf.h>
#include <zlib.h>

#include <cstddef>
#include <stdexcept>
#include <string_view>

namespace courier {

std::string_view ZlibEncoderContext::encodeChunk(std::size_t encoderChunkSize, std::string_view chunk) {
  z_stream& zs = _stream.get();
  const bool finishing = chunk.empty();

  _out.clear();
  zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(chunk.data()));
  zs.avail_in = static_cast<uInt>(chunk.size());

  while (true) {
    const std::size_t produced = _out.size();
    _out.resize(produced + encoderChunkSize);
    zs.next_out = reinterpret_cast<Bytef*>(_out.data() + produced);
    zs.avail_out = static_cast<uInt>(encoderChunkSize);

    const int ret = ::deflate(&zs, finishing ? Z_FINISH : Z_NO_FLUSH);
    if (ret == Z_STREAM_ERROR) {
      throw std::runtime_error(fmt::format("deflate failed with code {}", ret));
    }
    _out.resize(produced + encoderChunkSize - zs.avail_out);

    if (ret == Z_STREAM_END) {
      break;
    }
    // Output space left over means zlib consumed all input it could for now.
    if (zs.avail_out != 0 && zs.avail_in == 0) {
      break;
    }
  }
  return _out;
}

}  // namespace courier
