#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace courier::http {

struct Header {
  std::string name;
  std::string value;

  bool operator==(const Header&) const noexcept = default;
};

// Ordered multimap of header fields. Lookups ignore the case of names, insertion order and duplicates are kept,
// as well as the original case of names for emission.
class Headers {
 public:
  using const_iterator = std::vector<Header>::const_iterator;

  Headers() noexcept = default;

  Headers(std::initializer_list<Header> headers);

  // Appends a field, keeping existing ones with the same name.
  void add(std::string_view name, std::string_view value);

  // Replaces the value of the first field named 'name' in place and drops the other ones,
  // or appends the field if absent.
  void set(std::string_view name, std::string_view value);

  // Sets the field only if it is absent. Returns true if it was added.
  bool setDefault(std::string_view name, std::string_view value);

  // Removes all fields named 'name', returns the number of removed fields.
  std::size_t erase(std::string_view name);

  // Value of the first field named 'name'.
  [[nodiscard]] std::optional<std::string_view> get(std::string_view name) const noexcept;

  // Value of the first field named 'name', or 'defaultValue'.
  [[nodiscard]] std::string_view getOr(std::string_view name, std::string_view defaultValue) const noexcept;

  [[nodiscard]] std::vector<std::string_view> getAll(std::string_view name) const;

  [[nodiscard]] bool contains(std::string_view name) const noexcept;

  [[nodiscard]] std::size_t size() const noexcept { return _headers.size(); }
  [[nodiscard]] bool empty() const noexcept { return _headers.empty(); }

  void clear() noexcept { _headers.clear(); }

  [[nodiscard]] const_iterator begin() const noexcept { return _headers.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return _headers.end(); }

  // Hash of the ordered (name, value) sequence. Names are hashed case-insensitively.
  [[nodiscard]] std::size_t hash() const noexcept;

  // Same fields in the same order (names compared case-insensitively, values exactly).
  bool operator==(const Headers& other) const noexcept;

 private:
  std::vector<Header> _headers;
};

// Throws std::invalid_argument if 'name' is not a token or if 'value' contains characters forbidden in a field
// value (CR, LF, other controls except HTAB).
void ValidateHeader(std::string_view name, std::string_view value);

[[nodiscard]] bool IsValidHeaderName(std::string_view name) noexcept;

[[nodiscard]] bool IsValidHeaderValue(std::string_view value) noexcept;

}  // namespace courier::http
