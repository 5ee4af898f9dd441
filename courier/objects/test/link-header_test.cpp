#include "courier/link-header.hpp"

#include <gtest/gtest.h>

#include <string_view>
#include <vector>

#include "courier/url.hpp"

namespace courier::http {

namespace {
const Url kBase = Url::Parse("http://example.com/api/items?page=1");
}

TEST(LinkHeader, RelKeysAndResolution) {
  const std::vector<std::string_view> values{
      "<https://example.com/api/items?page=2>; rel=\"next\", </api/items?page=9>; rel=last; title='Last page'"};
  const auto links = ParseLinks(values, kBase);
  ASSERT_EQ(links.size(), 2U);

  EXPECT_EQ(links[0].key, "next");
  EXPECT_EQ(links[0].url.toString(), "https://example.com/api/items?page=2");

  EXPECT_EQ(links[1].key, "last");
  EXPECT_EQ(links[1].url.toString(), "http://example.com/api/items?page=9");
  ASSERT_EQ(links[1].params.size(), 2U);
  EXPECT_EQ(links[1].params[1].first, "title");
  EXPECT_EQ(links[1].params[1].second, "Last page");
}

TEST(LinkHeader, NoRelUsesTarget) {
  const std::vector<std::string_view> values{"<other>"};
  const auto links = ParseLinks(values, kBase);
  ASSERT_EQ(links.size(), 1U);
  EXPECT_EQ(links[0].key, "other");
  EXPECT_EQ(links[0].url.toString(), "http://example.com/api/other");
  EXPECT_TRUE(links[0].params.empty());
}

TEST(LinkHeader, MultipleHeaderValues) {
  const std::vector<std::string_view> values{"</a>; rel=first", "</b>; rel=second"};
  const auto links = ParseLinks(values, kBase);
  ASSERT_EQ(links.size(), 2U);
  EXPECT_EQ(links[0].key, "first");
  EXPECT_EQ(links[1].key, "second");
  EXPECT_EQ(links[1].url.rawPath(), "/b");
}

TEST(LinkHeader, CommaInsideParamIsNotASeparator) {
  const std::vector<std::string_view> values{"</a>; rel=first; title=\"x, y\", </b>; rel=second"};
  const auto links = ParseLinks(values, kBase);
  ASSERT_EQ(links.size(), 2U);
  EXPECT_EQ(links[0].params.back().second, "x, y");
}

TEST(LinkHeader, EmptyAndMalformed) {
  EXPECT_TRUE(ParseLinks({}, kBase).empty());
  const std::vector<std::string_view> values{"no-brackets; rel=x"};
  EXPECT_TRUE(ParseLinks(values, kBase).empty());
}

}  // namespace courier::http
