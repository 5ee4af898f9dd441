#pragma once

#include <string>
#include <string_view>

#include "courier/http-headers.hpp"

namespace courier::http {

struct MimeType {
  std::string type;
  std::string subtype;
  std::string suffix;
  // Parameter names are lower cased, values are stripped from surrounding spaces and quotes.
  Headers parameters;

  // "type/subtype[+suffix]", or empty.
  [[nodiscard]] std::string essence() const;
};

// Parses a Content-Type like value ("text/html; charset=utf-8", "application/ld+json").
// Never throws, an empty string gives an empty MimeType.
[[nodiscard]] MimeType ParseMimeType(std::string_view mimetype);

// True if a response media type satisfies 'expected'. "application/json" also accepts "application/*+json",
// other values are matched as substrings.
[[nodiscard]] bool IsExpectedContentType(std::string_view responseContentType, std::string_view expected);

}  // namespace courier::http
