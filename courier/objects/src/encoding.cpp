#include "courier/encoding.hpp"

#include <optional>
#include <string_view>

#include "courier/ascii.hpp"
#include "courier/features.hpp"

namespace courier {

std::optional<Encoding> ParseEncoding(std::string_view name) noexcept {
  name = TrimOws(name);
  if (name.empty() || CaseInsensitiveEqual(name, GetEncodingStr(Encoding::deflate))) {
    return Encoding::deflate;
  }
  if (CaseInsensitiveEqual(name, GetEncodingStr(Encoding::gzip))) {
    return Encoding::gzip;
  }
  if (CaseInsensitiveEqual(name, GetEncodingStr(Encoding::br))) {
    return Encoding::br;
  }
  return std::nullopt;
}

std::string_view DefaultAcceptEncoding() noexcept {
  if constexpr (brotliEnabled()) {
    return "gzip, deflate, br";
  } else {
    return "gzip, deflate";
  }
}

}  // namespace courier
