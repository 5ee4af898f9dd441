#include "courier/mime-type.hpp"

#include <cstddef>
#include <string>
#include <string_view>

#include "courier/ascii.hpp"
#include "courier/http-constants.hpp"

namespace courier::http {

namespace {

constexpr std::string_view Strip(std::string_view sv, std::string_view chars) {
  const auto first = sv.find_first_not_of(chars);
  if (first == std::string_view::npos) {
    return {};
  }
  return sv.substr(first, sv.find_last_not_of(chars) - first + 1);
}

constexpr std::string_view kWhitespace = " \t\r\n\f\v";

}  // namespace

std::string MimeType::essence() const {
  if (type.empty() && subtype.empty()) {
    return {};
  }
  std::string ret = type;
  ret.push_back('/');
  ret.append(subtype);
  if (!suffix.empty()) {
    ret.push_back('+');
    ret.append(suffix);
  }
  return ret;
}

MimeType ParseMimeType(std::string_view mimetype) {
  MimeType ret;
  if (mimetype.empty()) {
    return ret;
  }

  auto semicolon = mimetype.find(';');
  const auto fullType = ToLower(Strip(mimetype.substr(0, semicolon), kWhitespace));
  while (semicolon != std::string_view::npos) {
    const auto start = semicolon + 1;
    semicolon = mimetype.find(';', start);
    const auto item = mimetype.substr(start, semicolon == std::string_view::npos ? semicolon : semicolon - start);
    if (item.empty()) {
      continue;
    }
    const auto eq = item.find('=');
    const auto key = ToLower(Strip(item.substr(0, eq), kWhitespace));
    const auto value = eq == std::string_view::npos ? std::string_view{} : Strip(item.substr(eq + 1), " \"");
    ret.parameters.add(key, value);
  }

  std::string_view full = fullType;
  if (full == "*") {
    full = "*/*";
  }
  const auto slash = full.find('/');
  ret.type = full.substr(0, slash);
  if (slash != std::string_view::npos) {
    std::string_view subtype = full.substr(slash + 1);
    const auto plus = subtype.find('+');
    ret.subtype = subtype.substr(0, plus);
    if (plus != std::string_view::npos) {
      ret.suffix = subtype.substr(plus + 1);
    }
  }
  return ret;
}

bool IsExpectedContentType(std::string_view responseContentType, std::string_view expected) {
  if (expected == ContentTypeApplicationJson) {
    // ^application/(?:[\w.+-]+?\+)?json
    static constexpr std::string_view kPrefix = "application/";
    if (!StartsWithCaseInsensitive(responseContentType, kPrefix)) {
      return false;
    }
    std::string_view rest = responseContentType.substr(kPrefix.size());
    if (StartsWithCaseInsensitive(rest, "json")) {
      return true;
    }
    for (std::size_t pos = 0; pos < rest.size(); ++pos) {
      const char ch = rest[pos];
      if (ch == '+' && pos != 0 && StartsWithCaseInsensitive(rest.substr(pos + 1), "json")) {
        return true;
      }
      const bool wordChar = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
                            ch == '_' || ch == '.' || ch == '+' || ch == '-';
      if (!wordChar) {
        return false;
      }
    }
    return false;
  }
  return responseContentType.find(expected) != std::string_view::npos;
}

}  // namespace courier::http
