#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace courier {

// Parsed URI reference (RFC 3986).
// Components are kept in their raw (encoded) form, except user info which is decoded.
// Scheme and host are lower cased, IPv6 literals are stored without brackets.
class Url {
 public:
  using QueryParams = std::vector<std::pair<std::string, std::string>>;

  Url() noexcept = default;

  // Throws InvalidUrl for an unterminated IPv6 literal or an invalid port.
  static Url Parse(std::string_view str);

  [[nodiscard]] const std::string& scheme() const noexcept { return _scheme; }

  [[nodiscard]] const std::optional<std::string>& user() const noexcept { return _user; }
  [[nodiscard]] const std::optional<std::string>& password() const noexcept { return _password; }

  // Empty for a relative reference.
  [[nodiscard]] const std::string& rawHost() const noexcept { return _host; }

  [[nodiscard]] bool hasAuthority() const noexcept { return _hasAuthority; }

  [[nodiscard]] bool isIpv6Host() const noexcept { return _host.find(':') != std::string::npos; }

  [[nodiscard]] std::optional<uint16_t> explicitPort() const noexcept { return _port; }

  // Explicit port, or default port of the scheme (http, https, ws, wss).
  [[nodiscard]] std::optional<uint16_t> port() const noexcept;

  // True if the port is not explicit or equal to the default port of the scheme.
  [[nodiscard]] bool isDefaultPort() const noexcept;

  [[nodiscard]] const std::string& rawPath() const noexcept { return _path; }

  [[nodiscard]] const std::optional<std::string>& rawQuery() const noexcept { return _query; }

  [[nodiscard]] const std::optional<std::string>& fragment() const noexcept { return _fragment; }

  [[nodiscard]] Url withoutFragment() const;

  [[nodiscard]] Url withoutUserInfo() const;

  // Appends the encoded params to the existing query.
  [[nodiscard]] Url withQueryParams(const QueryParams& params) const;

  // Resolves 'reference' against this URL (RFC 3986 §5.2).
  [[nodiscard]] Url join(std::string_view reference) const;

  // host, bracketed if IPv6, followed by ':port' if the port is explicit.
  [[nodiscard]] std::string authority() const;

  [[nodiscard]] std::string toString() const;

  bool operator==(const Url&) const noexcept = default;

 private:
  std::string _scheme;
  std::optional<std::string> _user;
  std::optional<std::string> _password;
  std::string _host;
  std::optional<uint16_t> _port;
  std::string _path;
  std::optional<std::string> _query;
  std::optional<std::string> _fragment;
  bool _hasAuthority{false};
};

// Default port of well known schemes.
[[nodiscard]] std::optional<uint16_t> DefaultPort(std::string_view scheme) noexcept;

}  // namespace courier
