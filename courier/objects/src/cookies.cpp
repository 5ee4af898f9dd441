#include "courier/cookies.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "courier/ascii.hpp"
#include "courier/client-errors.hpp"

namespace courier {

namespace {

struct ReservedAttribute {
  std::string_view key;
  std::string_view outputName;
  bool flag;
};

constexpr std::array<ReservedAttribute, 10> kReserved{{
    {"comment", "Comment", false},
    {"domain", "Domain", false},
    {"expires", "expires", false},
    {"httponly", "HttpOnly", true},
    {"max-age", "Max-Age", false},
    {"partitioned", "Partitioned", true},
    {"path", "Path", false},
    {"samesite", "SameSite", false},
    {"secure", "Secure", true},
    {"version", "Version", false},
}};

const ReservedAttribute* FindReserved(std::string_view name) {
  const auto it = std::ranges::find_if(kReserved, [name](const auto& attr) { return CaseInsensitiveEqual(attr.key, name); });
  return it == kReserved.end() ? nullptr : &*it;
}

constexpr bool IsAlnum(char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9');
}

constexpr bool IsSpace(char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

// Characters allowed in a cookie name without quoting.
constexpr bool IsLegalChar(char ch) { return IsAlnum(ch) || std::string_view("!#$%&'*+-.^_`|~:").contains(ch); }

// Characters kept as is inside a quoted value.
constexpr bool IsUnescapedChar(char ch) { return IsLegalChar(ch) || std::string_view(" ()/<=>?@[]{}").contains(ch); }

// Characters accepted by the parser in a name.
constexpr bool IsParseKeyChar(char ch) {
  return IsAlnum(ch) || std::string_view("_!#%&'~`><@,:/$*+-.^|)(?}{").contains(ch);
}

// Characters accepted by the parser in an unquoted value.
constexpr bool IsParseValueChar(char ch) { return IsParseKeyChar(ch) || ch == '=' || ch == '[' || ch == ']'; }

bool IsLegalKey(std::string_view key) { return !key.empty() && std::ranges::all_of(key, IsLegalChar); }

constexpr bool IsDigit(char ch) { return ch >= '0' && ch <= '9'; }

// Matches the "Wdy, DD-Mon-YYYY HH:MM:SS GMT" form used by 'expires', which contains a ',' and spaces.
std::size_t MatchExpiresDate(std::string_view str) {
  std::size_t pos = 0;
  for (; pos < 3; ++pos) {
    if (pos >= str.size() || !(IsAlnum(str[pos]) || str[pos] == '_')) {
      return 0;
    }
  }
  if (!str.substr(pos).starts_with(", ")) {
    return 0;
  }
  pos += 2;
  // Greedy date part, then backtrack so that " HH:MM:SS GMT" still matches.
  std::size_t dateEnd = pos;
  while (dateEnd < str.size() && (IsAlnum(str[dateEnd]) || str[dateEnd] == '_' || str[dateEnd] == '-' ||
                                  IsSpace(str[dateEnd]))) {
    ++dateEnd;
  }
  for (std::size_t len = std::min<std::size_t>(11, dateEnd - pos); len >= 9; --len) {
    std::size_t cur = pos + len;
    if (cur >= str.size() || !IsSpace(str[cur])) {
      continue;
    }
    ++cur;
    std::size_t timeLen = 0;
    while (timeLen < 8 && cur + timeLen < str.size() && (IsDigit(str[cur + timeLen]) || str[cur + timeLen] == ':')) {
      ++timeLen;
    }
    if (timeLen != 8) {
      continue;
    }
    cur += 8;
    if (cur < str.size() && IsSpace(str[cur]) && str.substr(cur + 1).starts_with("GMT")) {
      return cur + 4;
    }
  }
  return 0;
}

enum class ItemType : std::uint8_t { Attribute, KeyValue };

struct ParsedItem {
  ItemType type;
  std::string key;
  std::string value;
  std::string codedValue;
};

}  // namespace

std::string QuoteCookieValue(std::string_view value) {
  if (IsLegalKey(value)) {
    return std::string(value);
  }
  std::string out;
  out.reserve(value.size() + 2U);
  out.push_back('"');
  for (char ch : value) {
    if (ch == '"' || ch == '\\') {
      out.push_back('\\');
      out.push_back(ch);
    } else if (IsUnescapedChar(ch)) {
      out.push_back(ch);
    } else {
      out.append(fmt::format("\\{:03o}", static_cast<unsigned char>(ch)));
    }
  }
  out.push_back('"');
  return out;
}

std::string UnquoteCookieValue(std::string_view value) {
  if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
    return std::string(value);
  }
  value = value.substr(1, value.size() - 2);
  std::string out;
  out.reserve(value.size());
  for (std::size_t pos = 0; pos < value.size(); ++pos) {
    if (value[pos] != '\\' || pos + 1 == value.size()) {
      out.push_back(value[pos]);
      continue;
    }
    const auto oct = value.substr(pos + 1, 3);
    if (oct.size() == 3 && oct[0] >= '0' && oct[0] <= '3' && oct[1] >= '0' && oct[1] <= '7' && oct[2] >= '0' &&
        oct[2] <= '7') {
      out.push_back(static_cast<char>(((oct[0] - '0') << 6) | ((oct[1] - '0') << 3) | (oct[2] - '0')));
      pos += 3;
    } else {
      out.push_back(value[pos + 1]);
      ++pos;
    }
  }
  return out;
}

Morsel::Morsel(std::string key, std::string value, std::string codedValue)
    : _key(std::move(key)), _value(std::move(value)), _codedValue(std::move(codedValue)) {
  if (FindReserved(_key) != nullptr) {
    throw CookieError(fmt::format("Attempt to set a reserved key '{}'", _key));
  }
  if (!IsLegalKey(_key)) {
    throw CookieError(fmt::format("Illegal key '{}'", _key));
  }
}

Morsel Morsel::FromValue(std::string key, std::string value) {
  auto coded = QuoteCookieValue(value);
  return {std::move(key), std::move(value), std::move(coded)};
}

void Morsel::setAttribute(std::string_view name, std::string_view value) {
  const auto* reserved = FindReserved(name);
  if (reserved == nullptr) {
    throw CookieError(fmt::format("Invalid attribute '{}'", name));
  }
  _attributes.insert_or_assign(std::string(reserved->key), std::string(value));
}

std::optional<std::string_view> Morsel::attribute(std::string_view name) const {
  const auto* reserved = FindReserved(name);
  if (reserved == nullptr) {
    return std::nullopt;
  }
  const auto it = _attributes.find(std::string(reserved->key));
  if (it == _attributes.end()) {
    return std::nullopt;
  }
  return std::string_view(it->second);
}

std::string Morsel::outputString() const {
  std::string out = fmt::format("{}={}", _key, _codedValue);
  for (const auto& [name, value] : _attributes) {
    if (value.empty()) {
      continue;
    }
    const auto* reserved = FindReserved(name);
    out.append("; ");
    if (reserved->flag) {
      out.append(reserved->outputName);
    } else if (reserved->key == "comment") {
      out.append(fmt::format("{}={}", reserved->outputName, QuoteCookieValue(value)));
    } else {
      out.append(fmt::format("{}={}", reserved->outputName, value));
    }
  }
  return out;
}

void Cookies::load(std::string_view str) {
  std::vector<ParsedItem> items;
  bool morselSeen = false;
  std::size_t pos = 0;

  const auto skipSpaces = [&str, &pos] {
    const auto start = pos;
    while (pos < str.size() && IsSpace(str[pos])) {
      ++pos;
    }
    return pos - start;
  };

  while (pos < str.size()) {
    skipSpaces();
    const auto keyStart = pos;
    while (pos < str.size() && IsParseKeyChar(str[pos])) {
      ++pos;
    }
    if (pos == keyStart) {
      break;
    }
    const std::string_view key = str.substr(keyStart, pos - keyStart);

    std::optional<std::string_view> rawValue;
    const auto beforeEq = pos;
    skipSpaces();
    if (pos < str.size() && str[pos] == '=') {
      ++pos;
      skipSpaces();
      const auto valueStart = pos;
      if (pos < str.size() && str[pos] == '"') {
        std::size_t cur = pos + 1;
        while (cur < str.size() && str[cur] != '"') {
          cur += str[cur] == '\\' ? 2 : 1;
        }
        if (cur >= str.size()) {
          break;
        }
        pos = cur + 1;
      } else if (const auto len = MatchExpiresDate(str.substr(pos)); len != 0) {
        pos += len;
      } else {
        while (pos < str.size() && IsParseValueChar(str[pos])) {
          ++pos;
        }
      }
      rawValue = str.substr(valueStart, pos - valueStart);
    } else {
      pos = beforeEq;
    }

    // The token ends with whitespace, ';' or the end of the string.
    const auto nbSpaces = skipSpaces();
    if (pos < str.size()) {
      if (str[pos] == ';') {
        ++pos;
      } else if (nbSpaces == 0) {
        break;
      }
    }

    if (key.front() == '$') {
      if (morselSeen) {
        items.emplace_back(ItemType::Attribute, std::string(key.substr(1)), std::string(rawValue.value_or("")),
                           std::string{});
      }
    } else if (const auto* reserved = FindReserved(key); reserved != nullptr) {
      if (!morselSeen) {
        return;
      }
      if (rawValue) {
        items.emplace_back(ItemType::Attribute, std::string(key), UnquoteCookieValue(*rawValue), std::string{});
      } else if (reserved->flag) {
        items.emplace_back(ItemType::Attribute, std::string(key), "true", std::string{});
      } else {
        return;
      }
    } else if (rawValue) {
      items.emplace_back(ItemType::KeyValue, std::string(key), UnquoteCookieValue(*rawValue), std::string(*rawValue));
      morselSeen = true;
    } else {
      return;
    }
  }

  Morsel* current = nullptr;
  for (auto& item : items) {
    if (item.type == ItemType::Attribute) {
      current->setAttribute(item.key, item.value);
      continue;
    }
    Morsel morsel(item.key, std::move(item.value), std::move(item.codedValue));
    const auto it = _morsels.find(item.key);
    if (it == _morsels.end()) {
      current = &_morsels.emplace(item.key, std::move(morsel)).first->second;
    } else {
      // Attributes of an existing morsel are kept.
      Morsel& existing = it->second;
      Morsel updated = std::move(morsel);
      for (const auto& reserved : kReserved) {
        if (auto attr = existing.attribute(reserved.key)) {
          updated.setAttribute(reserved.key, *attr);
        }
      }
      existing = std::move(updated);
      current = &existing;
    }
  }
}

void Cookies::set(std::string_view name, std::string_view value) {
  setMorsel(name, Morsel::FromValue(std::string(name), std::string(value)));
}

void Cookies::setMorsel(std::string_view name, Morsel morsel) {
  const auto it = _morsels.find(name);
  if (it == _morsels.end()) {
    _morsels.emplace(std::string(name), std::move(morsel));
  } else {
    it->second = std::move(morsel);
  }
}

const Morsel* Cookies::get(std::string_view name) const {
  const auto it = _morsels.find(name);
  return it == _morsels.end() ? nullptr : &it->second;
}

std::string Cookies::output() const {
  std::string out;
  for (const auto& [name, morsel] : _morsels) {
    if (!out.empty()) {
      out.append("; ");
    }
    out.append(morsel.outputString());
  }
  return out;
}

}  // namespace courier
