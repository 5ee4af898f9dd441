#include "courier/url.hpp"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "courier/ascii.hpp"
#include "courier/client-errors.hpp"
#include "courier/http-constants.hpp"
#include "courier/url-encode.hpp"

namespace courier {

namespace {

constexpr std::string_view kUserInfoSafe = "!$&'()*+,;=";

bool IsSchemeChar(char ch, bool first) {
  const bool alpha = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
  if (first) {
    return alpha;
  }
  return alpha || (ch >= '0' && ch <= '9') || ch == '+' || ch == '-' || ch == '.';
}

// Returns the scheme length, or 0 if 'str' does not start with a scheme.
std::size_t SchemeLength(std::string_view str) {
  for (std::size_t pos = 0; pos < str.size(); ++pos) {
    const char ch = str[pos];
    if (ch == ':') {
      return pos;
    }
    if (!IsSchemeChar(ch, pos == 0)) {
      return 0;
    }
  }
  return 0;
}

std::string RemoveDotSegments(std::string_view input) {
  std::vector<std::string_view> segments;
  const bool absolute = input.starts_with('/');
  bool trailingSlash = false;
  std::size_t pos = absolute ? 1 : 0;
  while (pos <= input.size()) {
    auto next = input.find('/', pos);
    if (next == std::string_view::npos) {
      next = input.size();
    }
    const auto segment = input.substr(pos, next - pos);
    trailingSlash = false;
    if (segment == "..") {
      if (!segments.empty()) {
        segments.pop_back();
      }
      trailingSlash = true;
    } else if (segment == ".") {
      trailingSlash = true;
    } else if (next != input.size() || !segment.empty()) {
      segments.push_back(segment);
    } else {
      trailingSlash = !segments.empty();
    }
    pos = next + 1;
  }

  std::string out;
  if (absolute) {
    out.push_back('/');
  }
  for (std::size_t idx = 0; idx < segments.size(); ++idx) {
    if (idx != 0) {
      out.push_back('/');
    }
    out.append(segments[idx]);
  }
  if (trailingSlash && !out.empty() && out.back() != '/') {
    out.push_back('/');
  }
  return out;
}

}  // namespace

std::optional<uint16_t> DefaultPort(std::string_view scheme) noexcept {
  if (scheme == "http" || scheme == "ws") {
    return http::kHttpPort;
  }
  if (scheme == "https" || scheme == "wss") {
    return http::kHttpsPort;
  }
  return std::nullopt;
}

Url Url::Parse(std::string_view str) {
  Url url;
  std::string_view rest = str;

  const auto schemeLen = SchemeLength(rest);
  if (schemeLen != 0) {
    url._scheme = ToLower(rest.substr(0, schemeLen));
    rest.remove_prefix(schemeLen + 1);
  }

  if (rest.starts_with("//")) {
    rest.remove_prefix(2);
    url._hasAuthority = true;
    const auto authorityEnd = rest.find_first_of("/?#");
    std::string_view authority = rest.substr(0, authorityEnd);
    rest.remove_prefix(authority.size());

    const auto at = authority.rfind('@');
    if (at != std::string_view::npos) {
      const std::string_view userInfo = authority.substr(0, at);
      authority.remove_prefix(at + 1);
      const auto colon = userInfo.find(':');
      url._user = url::Decode(userInfo.substr(0, colon));
      if (colon != std::string_view::npos) {
        url._password = url::Decode(userInfo.substr(colon + 1));
      }
    }

    std::string_view portStr;
    if (authority.starts_with('[')) {
      const auto closing = authority.find(']');
      if (closing == std::string_view::npos) {
        throw InvalidUrl(str);
      }
      url._host = ToLower(authority.substr(1, closing - 1));
      authority.remove_prefix(closing + 1);
      if (!authority.empty()) {
        if (authority.front() != ':') {
          throw InvalidUrl(str);
        }
        portStr = authority.substr(1);
      }
    } else {
      const auto colon = authority.rfind(':');
      url._host = ToLower(authority.substr(0, colon));
      if (colon != std::string_view::npos) {
        portStr = authority.substr(colon + 1);
      }
    }

    if (!portStr.empty()) {
      uint16_t port{};
      const auto [ptr, ec] = std::from_chars(portStr.data(), portStr.data() + portStr.size(), port);
      if (ec != std::errc() || ptr != portStr.data() + portStr.size()) {
        throw InvalidUrl(str);
      }
      url._port = port;
    }
  }

  const auto fragmentPos = rest.find('#');
  if (fragmentPos != std::string_view::npos) {
    url._fragment = std::string(rest.substr(fragmentPos + 1));
    rest = rest.substr(0, fragmentPos);
  }
  const auto queryPos = rest.find('?');
  if (queryPos != std::string_view::npos) {
    url._query = std::string(rest.substr(queryPos + 1));
    rest = rest.substr(0, queryPos);
  }
  url._path = std::string(rest);
  if (url._hasAuthority && url._path.empty()) {
    url._path = "/";
  }
  return url;
}

std::optional<uint16_t> Url::port() const noexcept {
  if (_port) {
    return _port;
  }
  return DefaultPort(_scheme);
}

bool Url::isDefaultPort() const noexcept { return !_port || _port == DefaultPort(_scheme); }

Url Url::withoutFragment() const {
  Url ret = *this;
  ret._fragment.reset();
  return ret;
}

Url Url::withoutUserInfo() const {
  Url ret = *this;
  ret._user.reset();
  ret._password.reset();
  return ret;
}

Url Url::withQueryParams(const QueryParams& params) const {
  if (params.empty()) {
    return *this;
  }
  Url ret = *this;
  const auto encoded = url::EncodeQuery(params);
  if (ret._query && !ret._query->empty()) {
    ret._query->push_back('&');
    ret._query->append(encoded);
  } else {
    ret._query = encoded;
  }
  return ret;
}

Url Url::join(std::string_view reference) const {
  const Url ref = Parse(reference);
  Url target;
  if (!ref._scheme.empty()) {
    target = ref;
    target._path = RemoveDotSegments(ref._path);
  } else {
    if (ref._hasAuthority) {
      target = ref;
      target._path = RemoveDotSegments(ref._path);
    } else {
      target = *this;
      target._fragment.reset();
      if (ref._path.empty()) {
        if (ref._query) {
          target._query = ref._query;
        }
      } else {
        if (ref._path.starts_with('/')) {
          target._path = RemoveDotSegments(ref._path);
        } else {
          std::string merged;
          if (_hasAuthority && _path.empty()) {
            merged = "/";
          } else {
            const auto lastSlash = _path.rfind('/');
            if (lastSlash != std::string::npos) {
              merged = _path.substr(0, lastSlash + 1);
            }
          }
          merged.append(ref._path);
          target._path = RemoveDotSegments(merged);
        }
        target._query = ref._query;
      }
    }
    target._scheme = _scheme;
  }
  target._fragment = ref._fragment;
  if (target._hasAuthority && target._path.empty()) {
    target._path = "/";
  }
  return target;
}

std::string Url::authority() const {
  std::string ret;
  if (isIpv6Host()) {
    ret.push_back('[');
    ret.append(_host);
    ret.push_back(']');
  } else {
    ret.append(_host);
  }
  if (_port) {
    ret.push_back(':');
    ret.append(std::to_string(*_port));
  }
  return ret;
}

std::string Url::toString() const {
  std::string ret;
  if (!_scheme.empty()) {
    ret.append(_scheme);
    ret.push_back(':');
  }
  if (_hasAuthority) {
    ret.append("//");
    if (_user) {
      ret.append(url::Encode(*_user, kUserInfoSafe));
      if (_password) {
        ret.push_back(':');
        ret.append(url::Encode(*_password, kUserInfoSafe));
      }
      ret.push_back('@');
    }
    ret.append(authority());
  }
  ret.append(_path);
  if (_query) {
    ret.push_back('?');
    ret.append(*_query);
  }
  if (_fragment) {
    ret.push_back('#');
    ret.append(*_fragment);
  }
  return ret;
}

}  // namespace courier
