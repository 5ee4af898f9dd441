#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace courier::url {

using Pairs = std::vector<std::pair<std::string, std::string>>;

/// Percent-encodes 'data'. Unreserved characters (ALPHA / DIGIT / "-" / "." / "_" / "~") and those listed in
/// 'safe' are kept as is, everything else becomes %XX with upper case hexadecimal digits.
/// If 'spaceAsPlus' is true, spaces are written as '+' instead of "%20".
[[nodiscard]] std::string Encode(std::string_view data, std::string_view safe = {}, bool spaceAsPlus = false);

/// Decodes %XX sequences. Invalid sequences are kept literally.
[[nodiscard]] std::string Decode(std::string_view data, bool plusAsSpace = false);

/// Serializes pairs as an application/x-www-form-urlencoded body ("a=1&b=x+y").
[[nodiscard]] std::string EncodeForm(const Pairs& pairs);

/// Serializes pairs for the query component of a URL. '/', '?', ':' and '@' are kept unescaped.
[[nodiscard]] std::string EncodeQuery(const Pairs& pairs);

}  // namespace courier::url
