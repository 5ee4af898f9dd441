#include "courier/charset.hpp"

#include <fmt/format.h>
#include <iconv.h>

#include <array>
#include <cerrno>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "courier/ascii.hpp"

namespace courier {

namespace {

struct CharsetAlias {
  std::string_view alias;
  std::string_view name;
};

// Aliases are compared after lower casing and replacing '_' by '-'.
constexpr std::array<CharsetAlias, 14> kAliases{{
    {"utf8", "utf-8"},
    {"utf-8", "utf-8"},
    {"u8", "utf-8"},
    {"latin1", "iso8859-1"},
    {"latin-1", "iso8859-1"},
    {"iso-8859-1", "iso8859-1"},
    {"iso8859-1", "iso8859-1"},
    {"l1", "iso8859-1"},
    {"ascii", "ascii"},
    {"us-ascii", "ascii"},
    {"windows-1252", "cp1252"},
    {"cp1252", "cp1252"},
    {"utf-16", "utf-16"},
    {"utf16", "utf-16"},
}};

class IconvHandle {
 public:
  IconvHandle(const char* to, const char* from) noexcept : _cd(::iconv_open(to, from)) {}

  IconvHandle(const IconvHandle&) = delete;
  IconvHandle& operator=(const IconvHandle&) = delete;
  IconvHandle(IconvHandle&&) = delete;
  IconvHandle& operator=(IconvHandle&&) = delete;

  ~IconvHandle() {
    if (valid()) {
      ::iconv_close(_cd);
    }
  }

  [[nodiscard]] bool valid() const noexcept { return _cd != reinterpret_cast<iconv_t>(-1); }

  [[nodiscard]] iconv_t get() const noexcept { return _cd; }

 private:
  iconv_t _cd;
};

std::string NormalizeName(std::string_view charset) {
  std::string name = ToLower(TrimOws(charset));
  for (char& ch : name) {
    if (ch == '_') {
      ch = '-';
    }
  }
  return name;
}

constexpr std::string_view kReplacementChar = "\xEF\xBF\xBD";

}  // namespace

std::optional<std::string> LookupCharset(std::string_view charset) {
  std::string name = NormalizeName(charset);
  if (name.empty()) {
    return std::nullopt;
  }
  for (const auto& alias : kAliases) {
    if (alias.alias == name) {
      return std::string(alias.name);
    }
  }
  IconvHandle handle("UTF-8", name.c_str());
  if (!handle.valid()) {
    return std::nullopt;
  }
  return name;
}

std::string DecodeToUtf8(std::string_view bytes, std::string_view charset, DecodeErrors errors) {
  const auto name = LookupCharset(charset);
  if (!name) {
    throw std::invalid_argument(fmt::format("Unknown encoding '{}'", charset));
  }
  IconvHandle handle("UTF-8", name->c_str());
  if (!handle.valid()) {
    throw std::invalid_argument(fmt::format("Unknown encoding '{}'", charset));
  }

  std::string out;
  out.reserve(bytes.size());
  std::array<char, 4096> buf;

  // iconv takes a non const input pointer but does not modify the input.
  char* src = const_cast<char*>(bytes.data());
  std::size_t srcLeft = bytes.size();
  bool flushed = false;
  while (srcLeft > 0 || !flushed) {
    char* dst = buf.data();
    std::size_t dstLeft = buf.size();
    std::size_t ret;
    if (srcLeft > 0) {
      ret = ::iconv(handle.get(), &src, &srcLeft, &dst, &dstLeft);
    } else {
      ret = ::iconv(handle.get(), nullptr, nullptr, &dst, &dstLeft);
      flushed = ret != static_cast<std::size_t>(-1);
    }
    out.append(buf.data(), static_cast<std::size_t>(dst - buf.data()));
    if (ret != static_cast<std::size_t>(-1)) {
      continue;
    }
    switch (errno) {
      case E2BIG:
        break;
      case EILSEQ:
        [[fallthrough]];
      case EINVAL:
        // Invalid or truncated sequence: skip one input byte.
        if (errors == DecodeErrors::Strict) {
          throw std::invalid_argument(fmt::format("'{}' codec can't decode byte 0x{:02x} in position {}", *name,
                                                  static_cast<unsigned char>(*src),
                                                  static_cast<std::size_t>(src - bytes.data())));
        }
        if (errors == DecodeErrors::Replace) {
          out.append(kReplacementChar);
        }
        ++src;
        --srcLeft;
        break;
      default:
        throw std::invalid_argument(fmt::format("iconv failure while decoding '{}'", *name));
    }
  }
  return out;
}

}  // namespace courier
