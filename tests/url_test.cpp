#include "fluent_request/utils/url.hpp"
#include "fluent_request/utils/url_utils.hpp"

#include <gtest/gtest.h>

#include <string>

using fluent_request::services::QueryParameter;
using fluent_request::utils::Url;
using fluent_request::utils::UrlUtils;

// ===========================================================================
// Url
// ===========================================================================

TEST(UrlTest, ParsesAbsoluteHttpUrls) {
    auto url = Url::parse("https://api.test:8443/v1/items?x=1");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->scheme(), "https");
    EXPECT_EQ(url->host(), "api.test");
    EXPECT_EQ(url->path(), "/v1/items");
    EXPECT_EQ(url->query(), "x=1");
    EXPECT_EQ(url->to_string(), "https://api.test:8443/v1/items?x=1");
}

TEST(UrlTest, RootPathIsSlash) {
    auto url = Url::parse("http://x.test");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->path(), "/");
    EXPECT_FALSE(url->query().has_value());
    EXPECT_EQ(url->to_string(), "http://x.test/");
}

TEST(UrlTest, RejectsRelativeAndNonHttpUrls) {
    EXPECT_FALSE(Url::parse("").has_value());
    EXPECT_FALSE(Url::parse("/relative/path").has_value());
    EXPECT_FALSE(Url::parse("x.test").has_value());
    EXPECT_FALSE(Url::parse("https://").has_value());
    EXPECT_FALSE(Url::parse("mailto:someone@x.test").has_value());
    EXPECT_FALSE(Url::parse("ftp://x.test/file").has_value());
}

TEST(UrlTest, CopiesAreIndependent) {
    auto original = Url::parse("https://x.test/a");
    ASSERT_TRUE(original.has_value());

    Url copy = *original;
    ASSERT_TRUE(copy.set_path("/b"));
    ASSERT_TRUE(copy.set_query("k=v"));

    EXPECT_EQ(original->to_string(), "https://x.test/a");
    EXPECT_EQ(copy.to_string(), "https://x.test/b?k=v");
    EXPECT_FALSE(copy == *original);

    copy = *original;
    EXPECT_TRUE(copy == *original);
}

TEST(UrlTest, SetQueryReplacesExistingQuery) {
    auto url = Url::parse("https://x.test/search?old=1");
    ASSERT_TRUE(url.has_value());
    ASSERT_TRUE(url->set_query("new=2&new=3"));
    EXPECT_EQ(url->to_string(), "https://x.test/search?new=2&new=3");
}

TEST(UrlTest, ClearQueryDropsQuery) {
    auto url = Url::parse("https://x.test/a?x=1");
    ASSERT_TRUE(url.has_value());
    EXPECT_TRUE(url->clear_query());
    EXPECT_FALSE(url->query().has_value());
    EXPECT_EQ(url->to_string(), "https://x.test/a");
}

TEST(UrlTest, MovedUrlKeepsValue) {
    auto url = Url::parse("https://x.test/a");
    ASSERT_TRUE(url.has_value());

    Url moved = std::move(*url);
    EXPECT_EQ(moved.to_string(), "https://x.test/a");
}

TEST(UrlTest, OversizedPartsAreRefusedAndUrlIsKept) {
    auto url = Url::parse("https://x.test/a?keep=1");
    ASSERT_TRUE(url.has_value());

    // libcurl refuses URL parts longer than 8000000 bytes
    const std::string oversized(8'000'001, 'a');
    EXPECT_FALSE(url->set_query(oversized));
    EXPECT_FALSE(url->set_path("/" + oversized));
    EXPECT_EQ(url->to_string(), "https://x.test/a?keep=1");
}

TEST(UrlTest, MovedFromUrlRefusesEdits) {
    auto url = Url::parse("https://x.test/a");
    ASSERT_TRUE(url.has_value());

    Url moved = std::move(*url);
    EXPECT_FALSE(url->set_query("x=1"));
    EXPECT_FALSE(url->set_path("/b"));
    EXPECT_FALSE(url->clear_query());
    EXPECT_FALSE(url->to_string().has_value());
    EXPECT_EQ(moved.to_string(), "https://x.test/a");
}

// ===========================================================================
// UrlUtils
// ===========================================================================

TEST(UrlUtilsTest, EncodeKeepsUnreservedCharacters) {
    EXPECT_EQ(UrlUtils::encode("AZaz09-_.~"), "AZaz09-_.~");
    EXPECT_EQ(UrlUtils::encode("a b+c/d?e"), "a%20b%2Bc%2Fd%3Fe");
    EXPECT_EQ(UrlUtils::encode(""), "");
}

TEST(UrlUtilsTest, EncodePathSegmentKeepsPathCharacters) {
    EXPECT_EQ(UrlUtils::encode_path_segment("users/42:edit@v1"), "users/42:edit@v1");
    EXPECT_EQ(UrlUtils::encode_path_segment("a b#c"), "a%20b%23c");
}

TEST(UrlUtilsTest, JoinPathUsesSingleSlash) {
    EXPECT_EQ(UrlUtils::join_path("/", "a"), "/a");
    EXPECT_EQ(UrlUtils::join_path("/a", "b"), "/a/b");
    EXPECT_EQ(UrlUtils::join_path("/a/", "/b"), "/a/b");
    EXPECT_EQ(UrlUtils::join_path("/a", "/b"), "/a/b");
    EXPECT_EQ(UrlUtils::join_path("/a", ""), "/a");
    EXPECT_EQ(UrlUtils::join_path("", "b"), "b");
}

TEST(UrlUtilsTest, BuildQueryStringPreservesOrder) {
    std::vector<QueryParameter> params{
        {"b", "2"},
        {"a", "1"},
        {"b", "3"},
        {"space name", "x y"}
    };
    EXPECT_EQ(UrlUtils::build_query_string(params), "b=2&a=1&b=3&space%20name=x%20y");
    EXPECT_EQ(UrlUtils::build_query_string({}), "");
}

TEST(UrlUtilsTest, ValidUrlCheck) {
    EXPECT_TRUE(UrlUtils::is_valid_url("https://x.test"));
    EXPECT_TRUE(UrlUtils::is_valid_url("http://127.0.0.1:3000/path"));
    EXPECT_FALSE(UrlUtils::is_valid_url("x.test"));
    EXPECT_FALSE(UrlUtils::is_valid_url("file:///etc/hosts"));
}
