#include "courier/content-disposition.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "courier/ascii.hpp"
#include "courier/charset.hpp"
#include "courier/log.hpp"
#include "courier/url-encode.hpp"

namespace courier::http {

namespace {

bool IsQuoted(std::string_view str) { return str.size() >= 2 && str.front() == '"' && str.back() == '"'; }

bool IsRfc5987(std::string_view str) { return IsToken(str) && std::ranges::count(str, '\'') == 2; }

bool IsExtendedParam(std::string_view key) { return key.ends_with('*'); }

// "name*0", "name*1*"...
bool IsContinuousParam(std::string_view key) {
  const auto star = key.find('*');
  if (star == std::string_view::npos) {
    return false;
  }
  std::string_view digits = key.substr(star + 1);
  if (digits.ends_with('*')) {
    digits.remove_suffix(1);
  }
  return !digits.empty() && std::ranges::all_of(digits, [](char ch) { return ch >= '0' && ch <= '9'; });
}

std::string Unescape(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t pos = 0; pos < text.size(); ++pos) {
    if (text[pos] == '\\' && pos + 1 < text.size()) {
      ++pos;
    }
    out.push_back(text[pos]);
  }
  return out;
}

std::string UnquoteValue(std::string_view quoted) {
  std::string_view inner = quoted.substr(1, quoted.size() - 2);
  const auto first = inner.find_first_not_of("\\/");
  inner = first == std::string_view::npos ? std::string_view{} : inner.substr(first);
  return Unescape(inner);
}

// "charset'lang'percent-encoded" -> decoded value. Throws std::invalid_argument on undecodable input.
std::string DecodeExtendedValue(std::string_view value) {
  const auto firstQuote = value.find('\'');
  const auto secondQuote = value.find('\'', firstQuote + 1);
  std::string_view encoding = value.substr(0, firstQuote);
  if (encoding.empty()) {
    encoding = "utf-8";
  }
  return DecodeToUtf8(url::Decode(value.substr(secondQuote + 1)), encoding, DecodeErrors::Strict);
}

ContentDisposition Invalid(std::string_view header) {
  ClientLog()->debug("Invalid Content-Disposition header: '{}'", header);
  return {};
}

}  // namespace

ContentDisposition ParseContentDisposition(std::string_view header) {
  if (header.empty()) {
    return {};
  }

  std::vector<std::string_view> parts;
  for (std::size_t start = 0;;) {
    const auto semicolon = header.find(';', start);
    parts.push_back(header.substr(start, semicolon == std::string_view::npos ? semicolon : semicolon - start));
    if (semicolon == std::string_view::npos) {
      break;
    }
    start = semicolon + 1;
  }

  const std::string_view dispType = parts.front();
  if (!IsToken(dispType)) {
    return Invalid(header);
  }

  ContentDisposition ret;
  for (std::size_t idx = 1; idx < parts.size(); ++idx) {
    const std::string_view item = parts[idx];
    if (item.empty()) {
      continue;
    }
    const auto eq = item.find('=');
    if (eq == std::string_view::npos) {
      return Invalid(header);
    }
    std::string key = ToLower(TrimOws(item.substr(0, eq)));
    std::string_view rawValue = item.substr(eq + 1);
    rawValue.remove_prefix(std::min(rawValue.find_first_not_of(" \t"), rawValue.size()));
    if (ret.params.contains(key)) {
      return Invalid(header);
    }

    std::string value;
    if (!IsToken(key)) {
      ClientLog()->debug("Invalid Content-Disposition parameter: '{}'", item);
      continue;
    }
    if (IsContinuousParam(key)) {
      if (IsQuoted(rawValue)) {
        value = Unescape(rawValue.substr(1, rawValue.size() - 2));
      } else if (IsToken(rawValue)) {
        value = rawValue;
      } else {
        ClientLog()->debug("Invalid Content-Disposition parameter: '{}'", item);
        continue;
      }
    } else if (IsExtendedParam(key)) {
      if (!IsRfc5987(rawValue)) {
        ClientLog()->debug("Invalid Content-Disposition parameter: '{}'", item);
        continue;
      }
      try {
        value = DecodeExtendedValue(rawValue);
      } catch (const std::invalid_argument& ex) {
        ClientLog()->debug("Invalid Content-Disposition parameter: '{}': {}", item, ex.what());
        continue;
      }
    } else if (IsQuoted(rawValue)) {
      value = UnquoteValue(rawValue);
    } else if (IsToken(rawValue)) {
      value = rawValue;
    } else if (idx + 1 < parts.size()) {
      // A ';' inside of a quoted value.
      std::string joined(rawValue);
      joined.push_back(';');
      joined.append(parts[idx + 1]);
      if (!IsQuoted(joined)) {
        return Invalid(header);
      }
      ++idx;
      value = UnquoteValue(joined);
    } else {
      return Invalid(header);
    }
    ret.params.insert_or_assign(std::move(key), std::move(value));
  }

  ret.type = ToLower(dispType);
  try {
    ret.filename = ContentDispositionFilename(ret.params);
  } catch (const std::invalid_argument& ex) {
    ClientLog()->debug("Undecodable Content-Disposition filename: {}", ex.what());
  }
  return ret;
}

std::optional<std::string> ContentDispositionFilename(const ContentDisposition::Params& params,
                                                      std::string_view name) {
  if (params.empty()) {
    return std::nullopt;
  }
  std::string extendedName(name);
  extendedName.push_back('*');
  if (auto it = params.find(extendedName); it != params.end()) {
    return it->second;
  }
  if (auto it = params.find(name); it != params.end()) {
    return it->second;
  }

  // Parameters are sorted by name, which orders continuations up to 'name*9'.
  std::string value;
  std::size_t num = 0;
  bool found = false;
  for (auto it = params.lower_bound(extendedName); it != params.end() && it->first.starts_with(extendedName); ++it) {
    std::string_view tail = std::string_view(it->first).substr(extendedName.size());
    if (tail.ends_with('*')) {
      tail.remove_suffix(1);
    }
    if (tail != std::to_string(num)) {
      break;
    }
    value.append(it->second);
    found = true;
    ++num;
  }
  if (!found) {
    return std::nullopt;
  }
  if (value.find('\'') != std::string::npos) {
    const auto firstQuote = value.find('\'');
    const auto secondQuote = value.find('\'', firstQuote + 1);
    if (secondQuote != std::string::npos) {
      return DecodeExtendedValue(value);
    }
  }
  return value;
}

}  // namespace courier::http
