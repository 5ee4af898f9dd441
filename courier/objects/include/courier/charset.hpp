#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace courier {

enum class DecodeErrors : uint8_t {
  Strict,   // throw std::invalid_argument on an invalid sequence
  Replace,  // replace invalid sequences by U+FFFD
  Ignore    // drop invalid sequences
};

// Canonical lower case name of a charset known by iconv ("UTF8" -> "utf-8", "Latin-1" -> "iso8859-1"),
// or nothing if iconv cannot convert from it.
[[nodiscard]] std::optional<std::string> LookupCharset(std::string_view charset);

// Converts 'bytes' encoded in 'charset' to UTF-8.
// Throws std::invalid_argument for an unknown charset, and for invalid input in strict mode.
[[nodiscard]] std::string DecodeToUtf8(std::string_view bytes, std::string_view charset,
                                       DecodeErrors errors = DecodeErrors::Strict);

}  // namespace courier
