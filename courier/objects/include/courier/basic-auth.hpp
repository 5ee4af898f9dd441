#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace courier {

class Url;

// HTTP basic authentication credentials (RFC 7617).
class BasicAuth {
 public:
  // Throws std::invalid_argument if 'login' contains ':'.
  explicit BasicAuth(std::string login, std::string password = {});

  // Decodes an 'Authorization: Basic ...' header value.
  // Throws std::invalid_argument for another scheme, invalid base64 or missing ':' separator.
  static BasicAuth Decode(std::string_view authHeader);

  // Credentials embedded in the URL, if any. A missing password is empty.
  static std::optional<BasicAuth> FromUrl(const Url& url);

  [[nodiscard]] const std::string& login() const noexcept { return _login; }
  [[nodiscard]] const std::string& password() const noexcept { return _password; }

  // Value of the Authorization header: "Basic <base64(login:password)>".
  [[nodiscard]] std::string encode() const;

  [[nodiscard]] std::size_t hash() const noexcept;

  bool operator==(const BasicAuth&) const noexcept = default;

 private:
  std::string _login;
  std::string _password;
};

}  // namespace courier
