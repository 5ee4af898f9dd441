#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace courier {

constexpr std::size_t B64EncodedLen(std::size_t binDataLen) { return ((binDataLen + 2) / 3) * 4; }

// Standard alphabet, padded with '='.
[[nodiscard]] std::string B64Encode(std::string_view binData);

// Whitespace and padding are skipped.
// Throws std::invalid_argument on a character outside the standard alphabet.
[[nodiscard]] std::string B64Decode(std::string_view ascData);

}  // namespace courier
