#include "courier/link-header.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "courier/url.hpp"

namespace courier::http {

namespace {

constexpr std::string_view kSpaces = " \t\r\n\f\v";

std::string_view Strip(std::string_view sv) {
  const auto first = sv.find_first_not_of(kSpaces);
  if (first == std::string_view::npos) {
    return {};
  }
  return sv.substr(first, sv.find_last_not_of(kSpaces) - first + 1);
}

// Splits on the commas followed by optional spaces and a '<'.
std::vector<std::string_view> SplitLinks(std::string_view str) {
  std::vector<std::string_view> ret;
  std::size_t start = 0;
  for (std::size_t pos = str.find(','); pos != std::string_view::npos; pos = str.find(',', pos + 1)) {
    const auto next = str.find_first_not_of(kSpaces, pos + 1);
    if (next != std::string_view::npos && str[next] == '<') {
      ret.push_back(str.substr(start, pos - start));
      start = pos + 1;
    }
  }
  ret.push_back(str.substr(start));
  return ret;
}

void AddParam(std::string_view param, std::vector<std::pair<std::string, std::string>>& params) {
  const auto eq = param.find('=');
  if (eq == std::string_view::npos) {
    return;
  }
  const auto key = Strip(param.substr(0, eq));
  if (key.find_first_of(kSpaces) != std::string_view::npos) {
    return;
  }
  auto value = Strip(param.substr(eq + 1));
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    value = value.substr(1, value.size() - 2);
  }
  params.emplace_back(std::string(key), std::string(value));
}

}  // namespace

std::vector<Link> ParseLinks(const std::vector<std::string_view>& values, const Url& baseUrl) {
  std::string joined;
  for (auto value : values) {
    if (!joined.empty()) {
      joined.append(", ");
    }
    joined.append(value);
  }

  std::vector<Link> links;
  if (joined.empty()) {
    return links;
  }
  for (std::string_view val : SplitLinks(joined)) {
    val.remove_prefix(std::min(val.find_first_not_of(kSpaces), val.size()));
    if (!val.starts_with('<')) {
      continue;
    }
    const auto closing = val.rfind('>');
    if (closing == std::string_view::npos || closing == 0) {
      continue;
    }
    const std::string_view target = val.substr(1, closing - 1);
    const std::string_view paramsStr = val.substr(closing + 1);

    Link link;
    auto semicolon = paramsStr.find(';');
    while (semicolon != std::string_view::npos) {
      const auto start = semicolon + 1;
      semicolon = paramsStr.find(';', start);
      AddParam(paramsStr.substr(start, semicolon == std::string_view::npos ? semicolon : semicolon - start),
               link.params);
    }

    link.key = target;
    for (const auto& [name, value] : link.params) {
      if (name == "rel") {
        link.key = value;
        break;
      }
    }
    link.url = baseUrl.join(target);
    links.push_back(std::move(link));
  }
  return links;
}

}  // namespace courier::http
