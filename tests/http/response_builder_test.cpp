/**
 * @file response_builder_test.cpp
 * @brief Google Test suite for the value-semantics ResponseBuilder
 */

#include <gtest/gtest.h>
#include "../test_utils.h"
#include "../../src/cpp/http/response_builder.h"

#include <map>
#include <string>
#include <vector>

using namespace ripcord::http;
namespace core = ripcord::core;
using ::testing::ElementsAre;

class ResponseBuilderTest : public RipcordTest {};

TEST_F(ResponseBuilderTest, Defaults) {
    ResponseBuilder res;
    EXPECT_EQ(res.status_code(), 200);
    EXPECT_EQ(res.content_type(), ResponseContentType::TEXT);
    EXPECT_EQ(res.body(), "");
    EXPECT_TRUE(res.headers().empty());

    TransportResponse out = res.finalize();
    EXPECT_EQ(out.status, 200);
    EXPECT_EQ(out.content_type, "text/plain; charset=utf-8");
    EXPECT_TRUE(out.body.empty());
}

TEST_F(ResponseBuilderTest, SettersLeaveReceiverUntouched) {
    ResponseBuilder original;
    ResponseBuilder changed = original.status(201).text("created").set_header("X-A", "1");

    EXPECT_EQ(original, ResponseBuilder());
    EXPECT_NE(changed, original);
    EXPECT_EQ(changed.status_code(), 201);
    EXPECT_EQ(changed.body(), "created");
}

TEST_F(ResponseBuilderTest, StatusShortcuts) {
    ResponseBuilder res;
    EXPECT_EQ(res.ok().status_code(), 200);
    EXPECT_EQ(res.bad_request().status_code(), 400);
    EXPECT_EQ(res.not_found().status_code(), 404);
    EXPECT_EQ(res.internal_server_error().status_code(), 500);

    int code = rng_.random_int(100, 599);
    EXPECT_EQ(res.status(static_cast<uint16_t>(code)).status_code(), code);
}

TEST_F(ResponseBuilderTest, JsonBody) {
    std::map<std::string, int> counts{{"b", 2}, {"a", 1}};
    ResponseBuilder res = ResponseBuilder().json(counts);

    EXPECT_EQ(res.content_type(), ResponseContentType::JSON);
    EXPECT_EQ(res.body(), R"({"a":1,"b":2})");
    EXPECT_EQ(res.finalize().content_type, "application/json");
}

TEST_F(ResponseBuilderTest, JsonScalarsAndContainers) {
    ResponseBuilder res;
    EXPECT_EQ(res.json(std::string("hi")).body(), "\"hi\"");
    EXPECT_EQ(res.json(42).body(), "42");
    EXPECT_EQ(res.json(std::vector<bool>{true, false}).body(), "[true,false]");
    EXPECT_EQ(res.json(JsonValue()).body(), "null");
}

TEST_F(ResponseBuilderTest, LastBodySetterWins) {
    ResponseBuilder res = ResponseBuilder().json(1).text("plain");
    EXPECT_EQ(res.content_type(), ResponseContentType::TEXT);
    EXPECT_EQ(res.body(), "plain");

    res = res.json(std::string("x"));
    EXPECT_EQ(res.content_type(), ResponseContentType::JSON);
}

TEST_F(ResponseBuilderTest, HeadersReplaceByExactName) {
    std::string value = rng_.random_string(16);
    ResponseBuilder res = ResponseBuilder()
        .set_header("X-Trace", "first")
        .set_header("Cache-Control", "no-store")
        .set_header("X-Trace", value);

    ASSERT_EQ(res.headers().size(), 2u);
    EXPECT_EQ(res.headers()[0].first, "X-Trace");
    EXPECT_EQ(res.get_header("X-Trace").value(), value);

    // Names differing in case are distinct entries
    res = res.set_header("x-trace", "lower");
    EXPECT_EQ(res.headers().size(), 3u);
}

TEST_F(ResponseBuilderTest, MissingHeader) {
    auto header = ResponseBuilder().get_header("Location");
    ASSERT_TRUE(header.is_err());
    EXPECT_EQ(header.error(), core::error_code::missing_header);
    EXPECT_EQ(header.get_error().describe(), "Missing header: Location");
}

TEST_F(ResponseBuilderTest, Redirect) {
    ResponseBuilder res = ResponseBuilder().redirect("/login");
    EXPECT_EQ(res.status_code(), 302);
    EXPECT_EQ(res.get_header("Location").value(), "/login");
}

TEST_F(ResponseBuilderTest, Cookies) {
    ResponseBuilder res = ResponseBuilder()
        .set_cookie("sid", "abc")
        .set_cookie("theme", "dark")
        .clear_cookie("theme");

    TransportResponse out = res.finalize();
    EXPECT_THAT(out.set_cookies, ElementsAre("sid=abc; Path=/", "theme=; Path=/; Max-Age=0"));
}

TEST_F(ResponseBuilderTest, FinalizeCarriesEverything) {
    ResponseBuilder res = ResponseBuilder()
        .status(418)
        .json(std::string("teapot"))
        .set_header("X-A", "1")
        .set_header("X-B", "2");

    TransportResponse out = res.finalize();
    EXPECT_EQ(out.status, 418);
    EXPECT_EQ(out.content_type, "application/json");
    EXPECT_EQ(out.body, "\"teapot\"");
    ASSERT_EQ(out.headers.size(), 2u);
    EXPECT_EQ(out.headers[1], (std::pair<std::string, std::string>("X-B", "2")));
    EXPECT_TRUE(out.set_cookies.empty());
}

TEST_F(ResponseBuilderTest, ContentTypeHeaderNames) {
    EXPECT_STREQ(content_type_header(ResponseContentType::JSON), "application/json");
    EXPECT_STREQ(content_type_header(ResponseContentType::TEXT), "text/plain; charset=utf-8");
}
