#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace courier {

constexpr unsigned char tolower(unsigned char ch) {
  if (ch >= 'A' && ch <= 'Z') {
    ch |= 0x20;
  }
  return ch;
}

constexpr char tolower(char ch) { return static_cast<char>(tolower(static_cast<unsigned char>(ch))); }

constexpr unsigned char toupper(unsigned char ch) {
  if (ch >= 'a' && ch <= 'z') {
    ch &= 0xDF;
  }
  return ch;
}

constexpr char toupper(char ch) { return static_cast<char>(toupper(static_cast<unsigned char>(ch))); }

/// RFC 7230: tchar = "!" / "#" / "$" / "%" / "&" / "'" / "*"
///                  / "+" / "-" / "." / "^" / "_" / "`" / "|" / "~"
///                  / DIGIT / ALPHA
constexpr bool IsTchar(unsigned char uc) noexcept {
  constexpr uint64_t kBitmap[2] = {
      (1ULL << '!') | (1ULL << '#') | (1ULL << '$') | (1ULL << '%') | (1ULL << '&') | (1ULL << '\'') | (1ULL << '*') |
          (1ULL << '+') | (1ULL << '-') | (1ULL << '.') | (0x3FFULL << '0'),

      (0x3FFFFFFULL << ('A' - 64)) | (1ULL << ('^' - 64)) | (1ULL << ('_' - 64)) | (0x3FFFFFFULL << ('a' - 64)) |
          (1ULL << ('`' - 64)) | (1ULL << ('|' - 64)) | (1ULL << ('~' - 64))};

  return uc < 128U && ((kBitmap[uc >> 6] >> (uc & 63)) & 1U) != 0U;
}

constexpr bool IsTchar(char ch) noexcept { return IsTchar(static_cast<unsigned char>(ch)); }

// True if 'token' is a non-empty sequence of tchars.
constexpr bool IsToken(std::string_view token) noexcept {
  if (token.empty()) {
    return false;
  }
  for (char ch : token) {
    if (!IsTchar(ch)) {
      return false;
    }
  }
  return true;
}

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t pos = 0; pos < lhs.size(); ++pos) {
    if (tolower(lhs[pos]) != tolower(rhs[pos])) {
      return false;
    }
  }
  return true;
}

constexpr bool CaseInsensitiveLess(std::string_view lhs, std::string_view rhs) {
  const auto minSize = lhs.size() < rhs.size() ? lhs.size() : rhs.size();
  for (std::size_t pos = 0; pos < minSize; ++pos) {
    auto lc = tolower(lhs[pos]);
    auto rc = tolower(rhs[pos]);
    if (lc != rc) {
      return lc < rc;
    }
  }
  return lhs.size() < rhs.size();
}

constexpr bool StartsWithCaseInsensitive(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() && CaseInsensitiveEqual(value.substr(0, prefix.size()), prefix);
}

// True if 'needle' appears in 'haystack', ignoring ASCII case.
constexpr bool ContainsCaseInsensitive(std::string_view haystack, std::string_view needle) {
  if (needle.size() > haystack.size()) {
    return false;
  }
  for (std::size_t pos = 0; pos + needle.size() <= haystack.size(); ++pos) {
    if (CaseInsensitiveEqual(haystack.substr(pos, needle.size()), needle)) {
      return true;
    }
  }
  return false;
}

struct CaseInsensitiveHashFunc {
  constexpr std::size_t operator()(std::string_view str) const noexcept {
    std::size_t hash = 0;
    for (char ch : str) {
      hash ^= static_cast<std::size_t>(tolower(ch)) + static_cast<std::size_t>(0x9e3779b97f4a7c15ULL) + (hash << 6) +
              (hash >> 2);
    }
    return hash;
  }
};

struct CaseInsensitiveEqualFunc {
  constexpr bool operator()(std::string_view lhs, std::string_view rhs) const noexcept {
    return CaseInsensitiveEqual(lhs, rhs);
  }
};

// Trim OWS (optional whitespace) per RFC7230: SP and HTAB only.
constexpr std::string_view TrimOws(std::string_view sv) noexcept {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t')) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t')) {
    sv.remove_suffix(1);
  }
  return sv;
}

[[nodiscard]] std::string ToLower(std::string_view str);

[[nodiscard]] std::string ToUpper(std::string_view str);

}  // namespace courier
