#pragma once

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

namespace courier::http {

// RFC 9112 §2.5 HTTP version token representation
struct Version {
  uint8_t major{};
  uint8_t minor{};

  // "HTTP/<major>.<minor>"
  [[nodiscard]] std::string str() const;

  constexpr auto operator<=>(const Version&) const noexcept = default;
};

inline constexpr Version HTTP_0_9{0, 9};
inline constexpr Version HTTP_1_0{1, 0};
inline constexpr Version HTTP_1_1{1, 1};

// Parses "1.1" or "HTTP/1.1".
// Throws std::invalid_argument if the format is invalid.
[[nodiscard]] Version ParseVersion(std::string_view str);

}  // namespace courier::http
