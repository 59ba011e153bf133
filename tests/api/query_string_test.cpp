// AceProxy - AceStream Multiplexing Proxy
// Tests for query string and URL component decoding

#include <gtest/gtest.h>
#include "aceproxy/api/query_string.hpp"

#include <string>

namespace aceproxy {
namespace api {
namespace test {

TEST(QueryStringTest, DecodesPlusAndPercent) {
    auto params = parseQueryString("name=Channel+One&hash=%61%62c&flag&=orphan");

    EXPECT_EQ(params["name"], "Channel One");
    EXPECT_EQ(params["hash"], "abc");
    EXPECT_EQ(params.count("flag"), 1u);
    EXPECT_EQ(params["flag"], "");
}

TEST(QueryStringTest, FirstValueWins) {
    auto params = parseQueryString("id=first&id=second");

    EXPECT_EQ(params["id"], "first");
}

TEST(QueryStringTest, EmptyQueryHasNoParams) {
    EXPECT_TRUE(parseQueryString("").empty());
    EXPECT_TRUE(parseQueryString("&&").empty());
}

TEST(QueryStringTest, UrlDecodeKeepsMalformedEscapes) {
    EXPECT_EQ(urlDecode("100%"), "100%");
    EXPECT_EQ(urlDecode("%zz1"), "%zz1");
    EXPECT_EQ(urlDecode("a+b"), "a+b");
    EXPECT_EQ(urlDecode("a+b", true), "a b");
    EXPECT_EQ(urlDecode("%2Fpath%2f"), "/path/");
}

} // namespace test
} // namespace api
} // namespace aceproxy
