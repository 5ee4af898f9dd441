#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace courier::http {

struct ContentDisposition {
  using Params = std::map<std::string, std::string, std::less<>>;

  // Lower cased disposition type ("attachment", "inline", ...). Empty for an invalid header.
  std::optional<std::string> type;
  // Lower cased parameter names. RFC 5987 extended values ("name*") are decoded.
  Params params;
  std::optional<std::string> filename;
};

// Parses a Content-Disposition value (RFC 6266, with RFC 2231 continuations and RFC 5987 extended values).
// Invalid parameters are skipped, and a malformed header gives an empty type with no parameters.
[[nodiscard]] ContentDisposition ParseContentDisposition(std::string_view header);

// Value of 'name' in the parsed parameters: 'name*' first, then 'name', then the concatenation of the
// 'name*0', 'name*1'... continuations.
[[nodiscard]] std::optional<std::string> ContentDispositionFilename(const ContentDisposition::Params& params,
                                                                    std::string_view name = "filename");

}  // namespace courier::http
