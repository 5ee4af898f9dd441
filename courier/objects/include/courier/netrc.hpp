#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "courier/basic-auth.hpp"

namespace courier {

// Parsed .netrc file (machine / default entries with login, account and password).
class Netrc {
 public:
  struct Entry {
    std::string login;
    std::optional<std::string> account;
    std::optional<std::string> password;

    bool operator==(const Entry&) const noexcept = default;
  };

  Netrc() noexcept = default;

  // Throws std::invalid_argument on a syntax error (unknown token, missing value, token outside of an entry).
  static Netrc Parse(std::string_view content);

  // Entry of 'host', or the 'default' entry, or nothing.
  [[nodiscard]] std::optional<Entry> authenticators(std::string_view host) const;

  // Macro definitions (macdef name -> body lines).
  [[nodiscard]] std::optional<std::string_view> macro(std::string_view name) const;

 private:
  struct Machine {
    std::string host;
    Entry entry;
  };

  struct Macro {
    std::string name;
    std::string body;
  };

  std::vector<Machine> _machines;
  std::vector<Macro> _macros;
  std::optional<Entry> _default;
};

// Loads the netrc file named by $NETRC, or $HOME/.netrc.
// Returns nothing if the file cannot be read or parsed. A warning is logged on the client logger when the file
// exists (or was explicitly named) but could not be used.
[[nodiscard]] std::optional<Netrc> NetrcFromEnv();

// Credentials of 'host' from 'netrc'. The login falls back to the account when empty.
// Throws std::out_of_range if there is no netrc or no matching entry.
[[nodiscard]] BasicAuth BasicAuthFromNetrc(const std::optional<Netrc>& netrc, std::string_view host);

}  // namespace courier
