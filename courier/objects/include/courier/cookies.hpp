#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace courier {

// One cookie: name, decoded value, value as written on the wire, and its attributes.
class Morsel {
 public:
  // Throws CookieError if 'key' is a reserved attribute name or contains illegal characters.
  Morsel(std::string key, std::string value, std::string codedValue);

  // Morsel whose coded value is 'value' quoted when needed.
  static Morsel FromValue(std::string key, std::string value);

  [[nodiscard]] const std::string& key() const noexcept { return _key; }
  [[nodiscard]] const std::string& value() const noexcept { return _value; }
  [[nodiscard]] const std::string& codedValue() const noexcept { return _codedValue; }

  // Attribute names are case-insensitive: expires, path, comment, domain, max-age, secure, httponly, version,
  // samesite, partitioned. Throws CookieError for any other name.
  void setAttribute(std::string_view name, std::string_view value);

  [[nodiscard]] std::optional<std::string_view> attribute(std::string_view name) const;

  // "key=coded" followed by the non-empty attributes, sorted by name and joined by "; ".
  [[nodiscard]] std::string outputString() const;

  bool operator==(const Morsel&) const noexcept = default;

 private:
  std::string _key;
  std::string _value;
  std::string _codedValue;
  std::map<std::string, std::string> _attributes;
};

// Set of cookies keyed by name and kept sorted by name.
class Cookies {
 public:
  using Map = std::map<std::string, Morsel, std::less<>>;
  using const_iterator = Map::const_iterator;

  // Parses a Cookie or Set-Cookie header value and merges it.
  // A malformed string is ignored from the first unparsable token. Throws CookieError for illegal names or
  // unknown attributes.
  void load(std::string_view str);

  // Sets a plain value, quoted on the wire when needed.
  void set(std::string_view name, std::string_view value);

  // Sets a pre-encoded morsel, kept as is.
  void setMorsel(std::string_view name, Morsel morsel);

  [[nodiscard]] const Morsel* get(std::string_view name) const;

  [[nodiscard]] std::size_t size() const noexcept { return _morsels.size(); }
  [[nodiscard]] bool empty() const noexcept { return _morsels.empty(); }

  [[nodiscard]] const_iterator begin() const noexcept { return _morsels.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return _morsels.end(); }

  // Value of a Cookie header: every morsel output, joined by "; ".
  [[nodiscard]] std::string output() const;

 private:
  Map _morsels;
};

// Quotes 'value' if it contains characters outside of the cookie token alphabet.
// Quoted values escape '"' and '\' with a backslash, and other special characters as \ooo octal sequences.
[[nodiscard]] std::string QuoteCookieValue(std::string_view value);

// Reverse of QuoteCookieValue. Unquoted input is returned as is.
[[nodiscard]] std::string UnquoteCookieValue(std::string_view value);

}  // namespace courier
