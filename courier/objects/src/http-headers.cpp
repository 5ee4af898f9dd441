#include "courier/http-headers.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "courier/ascii.hpp"

namespace courier::http {

Headers::Headers(std::initializer_list<Header> headers) {
  for (const auto& header : headers) {
    add(header.name, header.value);
  }
}

void Headers::add(std::string_view name, std::string_view value) {
  _headers.emplace_back(std::string(name), std::string(value));
}

void Headers::set(std::string_view name, std::string_view value) {
  const auto sameName = [name](const Header& header) { return CaseInsensitiveEqual(header.name, name); };
  auto it = std::ranges::find_if(_headers, sameName);
  if (it == _headers.end()) {
    add(name, value);
    return;
  }
  it->name.assign(name);
  it->value.assign(value);
  _headers.erase(std::remove_if(std::next(it), _headers.end(), sameName), _headers.end());
}

bool Headers::setDefault(std::string_view name, std::string_view value) {
  if (contains(name)) {
    return false;
  }
  add(name, value);
  return true;
}

std::size_t Headers::erase(std::string_view name) {
  return std::erase_if(_headers, [name](const Header& header) { return CaseInsensitiveEqual(header.name, name); });
}

std::optional<std::string_view> Headers::get(std::string_view name) const noexcept {
  for (const auto& header : _headers) {
    if (CaseInsensitiveEqual(header.name, name)) {
      return std::string_view(header.value);
    }
  }
  return std::nullopt;
}

std::string_view Headers::getOr(std::string_view name, std::string_view defaultValue) const noexcept {
  return get(name).value_or(defaultValue);
}

std::vector<std::string_view> Headers::getAll(std::string_view name) const {
  std::vector<std::string_view> values;
  for (const auto& header : _headers) {
    if (CaseInsensitiveEqual(header.name, name)) {
      values.emplace_back(header.value);
    }
  }
  return values;
}

bool Headers::contains(std::string_view name) const noexcept { return get(name).has_value(); }

std::size_t Headers::hash() const noexcept {
  std::size_t ret = _headers.size();
  const CaseInsensitiveHashFunc nameHash;
  const std::hash<std::string_view> valueHash;
  for (const auto& header : _headers) {
    ret ^= nameHash(header.name) + 0x9e3779b97f4a7c15ULL + (ret << 6) + (ret >> 2);
    ret ^= valueHash(header.value) + 0x9e3779b97f4a7c15ULL + (ret << 6) + (ret >> 2);
  }
  return ret;
}

bool Headers::operator==(const Headers& other) const noexcept {
  return std::ranges::equal(_headers, other._headers, [](const Header& lhs, const Header& rhs) {
    return CaseInsensitiveEqual(lhs.name, rhs.name) && lhs.value == rhs.value;
  });
}

bool IsValidHeaderName(std::string_view name) noexcept { return IsToken(name); }

bool IsValidHeaderValue(std::string_view value) noexcept {
  return std::ranges::all_of(value, [](char ch) {
    const auto uc = static_cast<unsigned char>(ch);
    return uc == '\t' || (uc >= 0x20 && uc != 0x7F);
  });
}

void ValidateHeader(std::string_view name, std::string_view value) {
  if (!IsValidHeaderName(name)) {
    throw std::invalid_argument(fmt::format("Invalid header name '{}'", name));
  }
  if (!IsValidHeaderValue(value)) {
    throw std::invalid_argument(fmt::format("Invalid value for header '{}'", name));
  }
}

}  // namespace courier::http
