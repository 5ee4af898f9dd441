#include "courier/netrc.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "courier/basic-auth.hpp"
#include "courier/file-read.hpp"
#include "courier/log.hpp"

namespace courier {

namespace {

constexpr bool IsSpace(char ch) { return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f'; }

class Lexer {
 public:
  explicit Lexer(std::string_view content) : _content(content) {}

  // Next token, or nothing at the end of the content. Comments ('#' to the end of the line) are skipped.
  std::optional<std::string> next() {
    for (;;) {
      while (_pos < _content.size() && IsSpace(_content[_pos])) {
        if (_content[_pos] == '\n') {
          ++_lineNo;
        }
        ++_pos;
      }
      if (_pos == _content.size()) {
        return std::nullopt;
      }
      if (_content[_pos] != '#') {
        break;
      }
      skipLine();
    }

    std::string token;
    if (_content[_pos] == '"') {
      ++_pos;
      while (_pos < _content.size() && _content[_pos] != '"') {
        if (_content[_pos] == '\\' && _pos + 1 < _content.size()) {
          ++_pos;
        }
        token.push_back(_content[_pos++]);
      }
      if (_pos < _content.size()) {
        ++_pos;
      }
      return token;
    }
    while (_pos < _content.size() && !IsSpace(_content[_pos])) {
      if (_content[_pos] == '\\' && _pos + 1 < _content.size()) {
        ++_pos;
      }
      token.push_back(_content[_pos++]);
    }
    return token;
  }

  // Lines following the current one, up to the first empty line.
  std::string macroBody() {
    skipLine();
    if (_pos < _content.size()) {
      ++_pos;
      ++_lineNo;
    }
    std::string body;
    while (_pos < _content.size()) {
      auto eol = _content.find('\n', _pos);
      if (eol == std::string_view::npos) {
        eol = _content.size();
      }
      const auto line = _content.substr(_pos, eol - _pos);
      _pos = eol == _content.size() ? eol : eol + 1;
      ++_lineNo;
      if (line.empty() || line == "\r") {
        break;
      }
      body.append(line);
      body.push_back('\n');
    }
    return body;
  }

  [[nodiscard]] std::size_t lineNo() const noexcept { return _lineNo; }

 private:
  void skipLine() {
    while (_pos < _content.size() && _content[_pos] != '\n') {
      ++_pos;
    }
  }

  std::string_view _content;
  std::size_t _pos{};
  std::size_t _lineNo{1};
};

}  // namespace

Netrc Netrc::Parse(std::string_view content) {
  Netrc netrc;
  Lexer lexer(content);

  const auto fail = [&lexer](std::string_view msg) {
    throw std::invalid_argument(fmt::format("netrc: {} (line {})", msg, lexer.lineNo()));
  };
  const auto value = [&](std::string_view key) {
    auto tok = lexer.next();
    if (!tok) {
      fail(fmt::format("missing value for '{}'", key));
    }
    return std::move(*tok);
  };

  Entry* current = nullptr;
  for (auto tok = lexer.next(); tok; tok = lexer.next()) {
    if (*tok == "machine") {
      netrc._machines.push_back(Machine{value("machine"), Entry{}});
      current = &netrc._machines.back().entry;
    } else if (*tok == "default") {
      netrc._default = Entry{};
      current = &*netrc._default;
    } else if (*tok == "macdef") {
      auto name = value("macdef");
      netrc._macros.push_back(Macro{std::move(name), lexer.macroBody()});
      current = nullptr;
    } else if (current == nullptr) {
      fail(fmt::format("bad toplevel token '{}'", *tok));
    } else if (*tok == "login" || *tok == "user") {
      current->login = value(*tok);
    } else if (*tok == "account") {
      current->account = value(*tok);
    } else if (*tok == "password") {
      current->password = value(*tok);
    } else {
      fail(fmt::format("bad follower token '{}'", *tok));
    }
  }
  return netrc;
}

std::optional<Netrc::Entry> Netrc::authenticators(std::string_view host) const {
  // The last definition of a machine wins.
  for (auto it = _machines.rbegin(); it != _machines.rend(); ++it) {
    if (it->host == host) {
      return it->entry;
    }
  }
  return _default;
}

std::optional<std::string_view> Netrc::macro(std::string_view name) const {
  for (const auto& mac : _macros) {
    if (mac.name == name) {
      return std::string_view(mac.body);
    }
  }
  return std::nullopt;
}

std::optional<Netrc> NetrcFromEnv() {
  const char* netrcEnv = std::getenv("NETRC");
  std::string path;
  if (netrcEnv != nullptr) {
    path = netrcEnv;
  } else {
    const char* home = std::getenv("HOME");
    if (home == nullptr) {
      ClientLog()->debug("Could not resolve home directory when trying to look for .netrc file");
      return std::nullopt;
    }
    path = fmt::format("{}/.netrc", home);
  }

  try {
    return Netrc::Parse(ReadWholeFile(path));
  } catch (const std::invalid_argument& ex) {
    ClientLog()->warn("Could not parse .netrc file: {}", ex.what());
  } catch (const std::system_error& ex) {
    if (netrcEnv != nullptr || IsRegularFile(path)) {
      ClientLog()->warn("Could not read .netrc file: {}", ex.what());
    }
  }
  return std::nullopt;
}

BasicAuth BasicAuthFromNetrc(const std::optional<Netrc>& netrc, std::string_view host) {
  if (!netrc) {
    throw std::out_of_range("No .netrc file found");
  }
  auto entry = netrc->authenticators(host);
  if (!entry) {
    throw std::out_of_range(fmt::format("No entry for {} found in the `.netrc` file.", host));
  }
  std::string username = !entry->login.empty() || !entry->account ? std::move(entry->login) : *entry->account;
  return BasicAuth(std::move(username), entry->password.value_or(std::string{}));
}

}  // namespace courier
