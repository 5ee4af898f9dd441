#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "courier/features.hpp"

namespace courier {

// Content codings that can be applied to a request body.
enum class Encoding : std::uint8_t { deflate, gzip, br };

constexpr std::string_view GetEncodingStr(Encoding enc) {
  switch (enc) {
    case Encoding::deflate:
      return "deflate";
    case Encoding::gzip:
      return "gzip";
    case Encoding::br:
      return "br";
  }
  return "unknown";
}

// Check if encoding is enabled in this build.
constexpr bool IsEncodingEnabled(Encoding enc) {
  switch (enc) {
    case Encoding::deflate:
      [[fallthrough]];
    case Encoding::gzip:
      return zlibEnabled();
    case Encoding::br:
      return brotliEnabled();
  }
  return false;
}

// Case-insensitive lookup of a content coding name. Empty means deflate.
[[nodiscard]] std::optional<Encoding> ParseEncoding(std::string_view name) noexcept;

// Value advertised in Accept-Encoding by default: "gzip, deflate", plus ", br" when brotli is enabled.
[[nodiscard]] std::string_view DefaultAcceptEncoding() noexcept;

}  // namespace courier
