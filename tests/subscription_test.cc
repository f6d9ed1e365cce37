#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "src/pipeline/authorizer.hpp"
#include "src/pipeline/subscription.hpp"
#include "src/pipeline/url.hpp"

#include <nlohmann/json.hpp>

namespace optick {
namespace {

TEST(SubscriptionTest, BuildsSubscribeMessage) {
    const auto msg = nlohmann::json::parse(
        build_subscription("abc-123", "full", {"NSE_FO|2", "NSE_FO|1"}));

    EXPECT_EQ(msg["guid"], "abc-123");
    EXPECT_EQ(msg["method"], "sub");
    EXPECT_EQ(msg["data"]["mode"], "full");
    EXPECT_EQ(msg["data"]["instrumentKeys"],
              nlohmann::json::array({"NSE_FO|1", "NSE_FO|2"}));
}

TEST(SubscriptionTest, CorrelationIdsAreFresh) {
    const std::string a = make_correlation_id();
    const std::string b = make_correlation_id();
    EXPECT_EQ(a.size(), 36u);
    EXPECT_NE(a, b);
}

TEST(AuthorizeResponseTest, ExtractsRedirectUri) {
    const std::string body =
        R"({"status":"success","data":{"authorized_redirect_uri":"wss://feed.example/v3?code=x"}})";
    EXPECT_EQ(parse_authorize_response(200, body), "wss://feed.example/v3?code=x");

    const std::string camel = R"({"data":{"authorizedRedirectUri":"wss://feed.example/v3"}})";
    EXPECT_EQ(parse_authorize_response(200, camel), "wss://feed.example/v3");
}

TEST(AuthorizeResponseTest, SurfacesServerErrors) {
    const std::string body =
        R"({"status":"error","errors":[{"errorCode":"UDAPI100050","message":"Invalid token"}]})";
    try {
        parse_authorize_response(401, body);
        FAIL() << "expected AuthError";
    } catch (const AuthError& e) {
        EXPECT_NE(std::string(e.what()).find("UDAPI100050"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("401"), std::string::npos);
    }
}

TEST(AuthorizeResponseTest, RejectsUnexpectedBodies) {
    EXPECT_THROW(parse_authorize_response(502, "<html>bad gateway</html>"), AuthError);
    EXPECT_THROW(parse_authorize_response(200, R"({"data":{}})"), AuthError);
    EXPECT_THROW(parse_authorize_response(200, R"({"data":{"authorized_redirect_uri":""}})"),
                 AuthError);
}

TEST(AuthorizerTest, RefusesEmptyCredentialBeforeConnecting) {
    HttpsAuthorizer auth("https://api.example.invalid/authorize");
    EXPECT_THROW(auth.authorize(""), AuthError);

    HttpsAuthorizer plain("http://api.example.invalid/authorize");
    EXPECT_THROW(plain.authorize("token"), AuthError);
}

TEST(UrlTest, ParsesWebsocketUrls) {
    auto u = parse_url("wss://feed.example.com/market-data-feed/v3?code=abc");
    ASSERT_TRUE(u.has_value());
    EXPECT_EQ(u->scheme, "wss");
    EXPECT_EQ(u->host, "feed.example.com");
    EXPECT_EQ(u->port, "443");
    EXPECT_EQ(u->target, "/market-data-feed/v3?code=abc");
    EXPECT_TRUE(u->secure());

    auto local = parse_url("ws://127.0.0.1:8765");
    ASSERT_TRUE(local.has_value());
    EXPECT_EQ(local->port, "8765");
    EXPECT_EQ(local->target, "/");
    EXPECT_FALSE(local->secure());
}

TEST(UrlTest, RejectsOtherSchemes) {
    EXPECT_FALSE(parse_url("ftp://host/").has_value());
    EXPECT_FALSE(parse_url("feed.example.com").has_value());
    EXPECT_FALSE(parse_url("wss:///path").has_value());
}

}  // namespace
}  // namespace optick
