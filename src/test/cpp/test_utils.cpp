#include <gtest/gtest.h>
#include "utils.h"
#include <map>
#include <set>

// =============================================================================
// select_api_key
// =============================================================================

TEST(KeySelectorTest, SingleKeyReturnedUnchanged) {
    for (int i = 0; i < 50; i++) {
        EXPECT_EQ(Utils::select_api_key("single"), "single");
    }
}

TEST(KeySelectorTest, SingleKeyWhitespaceKept) {
    // 无逗号时不做任何处理
    EXPECT_EQ(Utils::select_api_key(" spaced "), " spaced ");
    EXPECT_EQ(Utils::select_api_key(""), "");
}

TEST(KeySelectorTest, EveryCandidateIsReachable) {
    std::set<std::string> seen;
    for (int i = 0; i < 1000; i++) {
        std::string key = Utils::select_api_key("a,b,c");
        ASSERT_TRUE(key == "a" || key == "b" || key == "c") << key;
        seen.insert(key);
    }
    EXPECT_EQ(seen.size(), 3u);
}

TEST(KeySelectorTest, CandidatesAreTrimmed) {
    std::set<std::string> seen;
    for (int i = 0; i < 500; i++) {
        std::string key = Utils::select_api_key(" a , b ");
        ASSERT_TRUE(key == "a" || key == "b") << "'" << key << "'";
        seen.insert(key);
    }
    EXPECT_EQ(seen.size(), 2u);
}

TEST(KeySelectorTest, EmptyCandidatesDropped) {
    for (int i = 0; i < 200; i++) {
        EXPECT_EQ(Utils::select_api_key("a,,b,").find(','), std::string::npos);
        std::string key = Utils::select_api_key(",x,");
        EXPECT_EQ(key, "x");
    }
}

TEST(KeySelectorTest, NoUsableCandidateReturnsRaw) {
    EXPECT_EQ(Utils::select_api_key(",,"), ",,");
    EXPECT_EQ(Utils::select_api_key(" , "), " , ");
}

TEST(KeySelectorTest, DuplicatesWeightSelection) {
    std::map<std::string, int> counts;
    for (int i = 0; i < 3000; i++) {
        counts[Utils::select_api_key("a,a,b")]++;
    }
    EXPECT_EQ(counts.size(), 2u);
    EXPECT_GT(counts["a"], counts["b"]);
}

// =============================================================================
// Query string handling
// =============================================================================

TEST(QueryTest, ParseKeepsOrderAndDecodes) {
    auto params = Utils::parse_query("key=k%2C1&alt=sse&q=a+b&flag");
    ASSERT_EQ(params.size(), 4u);
    EXPECT_EQ(params[0].first, "key");
    EXPECT_EQ(params[0].second, "k,1");
    EXPECT_EQ(params[1].first, "alt");
    EXPECT_EQ(params[1].second, "sse");
    EXPECT_EQ(params[2].second, "a b");
    EXPECT_EQ(params[3].first, "flag");
    EXPECT_EQ(params[3].second, "");
}

TEST(QueryTest, ParseSkipsEmptyPairsAndLeadingMark) {
    auto params = Utils::parse_query("?a=1&&b=2&");
    ASSERT_EQ(params.size(), 2u);
    EXPECT_EQ(params[0].first, "a");
    EXPECT_EQ(params[1].first, "b");
    EXPECT_TRUE(Utils::parse_query("").empty());
}

TEST(QueryTest, ParseKeepsDuplicates) {
    auto params = Utils::parse_query("x=1&x=2");
    ASSERT_EQ(params.size(), 2u);
    EXPECT_EQ(params[0].second, "1");
    EXPECT_EQ(params[1].second, "2");
}

TEST(QueryTest, FormEncoding) {
    EXPECT_EQ(Utils::form_encode("abc-._*XYZ019"), "abc-._*XYZ019");
    EXPECT_EQ(Utils::form_encode("a b"), "a+b");
    EXPECT_EQ(Utils::form_encode("a/b:c,d~"), "a%2Fb%3Ac%2Cd%7E");
    EXPECT_EQ(Utils::form_decode("a%2Fb+c"), "a/b c");
    // 不完整的转义原样保留
    EXPECT_EQ(Utils::form_decode("100%"), "100%");
    EXPECT_EQ(Utils::form_decode("%zz"), "%zz");
}

TEST(QueryTest, EncodeQuery) {
    QueryParams params = {{"alt", "sse"}, {"key", "a b"}};
    EXPECT_EQ(Utils::encode_query(params), "alt=sse&key=a+b");
    EXPECT_EQ(Utils::encode_query({}), "");
}

// =============================================================================
// build_target_url
// =============================================================================

TEST(TargetUrlTest, NoParamsHasNoQuestionMark) {
    EXPECT_EQ(Utils::build_target_url("/v1beta/models", {}, "example.com"),
              "https://example.com/v1beta/models");
}

TEST(TargetUrlTest, ParamsPreservedInOrder) {
    QueryParams params = {{"alt", "sse"}, {"pageSize", "10"}};
    EXPECT_EQ(Utils::build_target_url("/v1beta/models", params, "example.com", "http"),
              "http://example.com/v1beta/models?alt=sse&pageSize=10");
}

TEST(TargetUrlTest, KeyParamResolvedToOneCandidate) {
    QueryParams params = {{"key", "k1,k2"}, {"alt", "sse"}};
    for (int i = 0; i < 100; i++) {
        std::string url = Utils::build_target_url("/p", params, "h");
        EXPECT_TRUE(url == "https://h/p?key=k1&alt=sse" || url == "https://h/p?key=k2&alt=sse") << url;
    }
}

TEST(TargetUrlTest, RotatedKeyCollapsesDuplicates) {
    QueryParams params = {{"key", "k1,k2"}, {"alt", "sse"}, {"key", "k3"}};
    for (int i = 0; i < 100; i++) {
        std::string url = Utils::build_target_url("/p", params, "h");
        EXPECT_TRUE(url == "https://h/p?key=k1&alt=sse" || url == "https://h/p?key=k2&alt=sse") << url;
    }
}

TEST(TargetUrlTest, SingleKeyDuplicatesKept) {
    // 第一个 key 没有逗号时不做任何改动
    QueryParams params = {{"key", "k1"}, {"key", "k2,k3"}};
    EXPECT_EQ(Utils::build_target_url("/p", params, "h"), "https://h/p?key=k1&key=k2%2Ck3");
}

TEST(TargetUrlTest, OtherParamsNotSplit) {
    QueryParams params = {{"fields", "a,b"}};
    EXPECT_EQ(Utils::build_target_url("/p", params, "h"), "https://h/p?fields=a%2Cb");
}

// =============================================================================
// Path helpers
// =============================================================================

TEST(PathTest, StreamingPathDetection) {
    EXPECT_TRUE(Utils::is_streaming_path("/v1beta/models/gemini-pro:streamGenerateContent"));
    EXPECT_FALSE(Utils::is_streaming_path("/v1beta/models/gemini-pro:generateContent"));
    EXPECT_FALSE(Utils::is_streaming_path("/v1beta/models/gemini-pro:streamGenerateContent/extra"));
    EXPECT_FALSE(Utils::is_streaming_path("/v1beta/models"));
    EXPECT_FALSE(Utils::is_streaming_path(""));
}

TEST(PathTest, RewriteToNonStreaming) {
    EXPECT_EQ(Utils::to_non_streaming_path("/v1beta/models/x:streamGenerateContent"),
              "/v1beta/models/x:generateContent");
    EXPECT_EQ(Utils::to_non_streaming_path("/v1beta/models"), "/v1beta/models");
}

TEST(PathTest, RawPathKeepsPercentEncoding) {
    httplib::Request req;
    req.path = "/v1beta/models/x:streamGenerateContent";
    req.target = "/v1beta/models/x%3AstreamGenerateContent?key=k";
    EXPECT_EQ(Utils::raw_path(req), "/v1beta/models/x%3AstreamGenerateContent");
    EXPECT_FALSE(Utils::is_streaming_path(Utils::raw_path(req)));

    req.target.clear();
    EXPECT_EQ(Utils::raw_path(req), "/v1beta/models/x:streamGenerateContent");
}

TEST(PathTest, SplitTarget) {
    auto parts = Utils::split_target("/a/b?x=1&y=2");
    EXPECT_EQ(parts.first, "/a/b");
    EXPECT_EQ(parts.second, "x=1&y=2");

    parts = Utils::split_target("/a/b");
    EXPECT_EQ(parts.first, "/a/b");
    EXPECT_EQ(parts.second, "");
}

// =============================================================================
// Misc
// =============================================================================

TEST(UtilsTest, CaseInsensitiveEquals) {
    EXPECT_TRUE(Utils::iequals("Content-Type", "content-type"));
    EXPECT_FALSE(Utils::iequals("Content-Type", "Content-Length"));
    EXPECT_FALSE(Utils::iequals("abc", "abcd"));
}

TEST(UtilsTest, UuidFormat) {
    std::string id = Utils::generate_uuid();
    ASSERT_EQ(id.size(), 36u);
    EXPECT_EQ(id[8], '-');
    EXPECT_EQ(id[13], '-');
    EXPECT_EQ(id[14], '4');
    EXPECT_NE(Utils::generate_uuid(), id);
}

TEST(UtilsTest, CorsHeadersOverwrite) {
    httplib::Response res;
    res.set_header("Access-Control-Allow-Origin", "https://upstream.example");
    Utils::apply_cors_headers(res);

    EXPECT_EQ(res.get_header_value_count("Access-Control-Allow-Origin"), 1u);
    EXPECT_EQ(res.get_header_value("Access-Control-Allow-Origin"), "*");
    EXPECT_EQ(res.get_header_value("Access-Control-Allow-Methods"), "GET, POST, OPTIONS");
    EXPECT_EQ(res.get_header_value("Access-Control-Allow-Headers"), "Content-Type, Authorization");
}

TEST(UtilsTest, SendErrorBody) {
    httplib::Response res;
    Utils::send_error(res, "Upstream request failed", "timeout", 502);
    EXPECT_EQ(res.status, 502);
    auto body = nlohmann::json::parse(res.body);
    EXPECT_EQ(body["error"], "Upstream request failed");
    EXPECT_EQ(body["detail"], "timeout");
}
