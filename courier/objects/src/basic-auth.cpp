#include "courier/basic-auth.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "courier/ascii.hpp"
#include "courier/base64.hpp"
#include "courier/url.hpp"

namespace courier {

BasicAuth::BasicAuth(std::string login, std::string password)
    : _login(std::move(login)), _password(std::move(password)) {
  if (_login.find(':') != std::string::npos) {
    throw std::invalid_argument("A \":\" is not allowed in login (RFC 1945#section-11.1)");
  }
}

BasicAuth BasicAuth::Decode(std::string_view authHeader) {
  authHeader = TrimOws(authHeader);
  const auto space = authHeader.find(' ');
  if (space == std::string_view::npos) {
    throw std::invalid_argument("Could not parse authorization header.");
  }
  if (!CaseInsensitiveEqual(authHeader.substr(0, space), "basic")) {
    throw std::invalid_argument("Unknown authorization method");
  }

  std::string decoded;
  try {
    decoded = B64Decode(TrimOws(authHeader.substr(space + 1)));
  } catch (const std::invalid_argument&) {
    throw std::invalid_argument("Invalid base64 encoding.");
  }

  const auto colon = decoded.find(':');
  if (colon == std::string::npos) {
    throw std::invalid_argument("Invalid credentials.");
  }
  return BasicAuth(decoded.substr(0, colon), decoded.substr(colon + 1));
}

std::optional<BasicAuth> BasicAuth::FromUrl(const Url& url) {
  if (!url.user() && !url.password()) {
    return std::nullopt;
  }
  return BasicAuth(url.user().value_or(std::string{}), url.password().value_or(std::string{}));
}

std::string BasicAuth::encode() const {
  std::string creds;
  creds.reserve(_login.size() + 1U + _password.size());
  creds.append(_login);
  creds.push_back(':');
  creds.append(_password);
  return "Basic " + B64Encode(creds);
}

std::size_t BasicAuth::hash() const noexcept {
  const std::hash<std::string> strHash;
  std::size_t ret = strHash(_login);
  ret ^= strHash(_password) + 0x9e3779b97f4a7c15ULL + (ret << 6) + (ret >> 2);
  return ret;
}

}  // namespace courier
