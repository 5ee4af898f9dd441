#include "courier/url-encode.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace courier::url {

namespace {

constexpr bool IsUnreserved(char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') || ch == '-' ||
         ch == '.' || ch == '_' || ch == '~';
}

constexpr int FromHexDigit(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'A' && ch <= 'F') {
    return 10 + (ch - 'A');
  }
  if (ch >= 'a' && ch <= 'f') {
    return 10 + (ch - 'a');
  }
  return -1;
}

std::string EncodePairs(const Pairs& pairs, std::string_view safe) {
  std::string out;
  for (const auto& [key, value] : pairs) {
    if (!out.empty()) {
      out.push_back('&');
    }
    out.append(Encode(key, safe, true));
    out.push_back('=');
    out.append(Encode(value, safe, true));
  }
  return out;
}

}  // namespace

std::string Encode(std::string_view data, std::string_view safe, bool spaceAsPlus) {
  static constexpr const char* const kHexits = "0123456789ABCDEF";

  std::string out;
  out.reserve(data.size());
  for (char ch : data) {
    if (IsUnreserved(ch) || safe.find(ch) != std::string_view::npos) {
      out.push_back(ch);
    } else if (ch == ' ' && spaceAsPlus) {
      out.push_back('+');
    } else {
      const auto uc = static_cast<unsigned char>(ch);
      out.push_back('%');
      out.push_back(kHexits[uc >> 4U]);
      out.push_back(kHexits[uc & 0x0FU]);
    }
  }
  return out;
}

std::string Decode(std::string_view data, bool plusAsSpace) {
  std::string out;
  out.reserve(data.size());
  for (std::size_t pos = 0; pos < data.size(); ++pos) {
    const char ch = data[pos];
    if (ch == '+' && plusAsSpace) {
      out.push_back(' ');
      continue;
    }
    if (ch == '%' && pos + 2 < data.size()) {
      const int hi = FromHexDigit(data[pos + 1]);
      const int lo = FromHexDigit(data[pos + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>((hi << 4) | lo));
        pos += 2;
        continue;
      }
    }
    out.push_back(ch);
  }
  return out;
}

std::string EncodeForm(const Pairs& pairs) { return EncodePairs(pairs, {}); }

std::string EncodeQuery(const Pairs& pairs) { return EncodePairs(pairs, "/?:@"); }

}  // namespace courier::url
