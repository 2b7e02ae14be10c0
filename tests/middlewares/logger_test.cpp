/**
 * @file logger_test.cpp
 * @brief Google Test suite for the access-log middleware
 */

#include <gtest/gtest.h>
#include "../test_utils.h"
#include "../../src/cpp/core/logger.h"
#include "../../src/cpp/middlewares/logger.h"

#include <string>

using namespace ripcord::http;
namespace core = ripcord::core;
namespace middlewares = ripcord::middlewares;
using ::testing::HasSubstr;
using ::testing::Not;

class AccessLoggerTest : public RipcordTest {
protected:
    TempFile file_;
    MiddlewareChain chain_;
    Handler handler_ = [](const RequestContext&, ResponseBuilder res) {
        return res.status(201).text("made");
    };

    void SetUp() override {
        RipcordTest::SetUp();
        ASSERT_TRUE(core::Logger::instance().set_output_file(file_.path().c_str()));
        core::Logger::instance().set_level(core::LogLevel::INFO);
    }

    void TearDown() override {
        core::Logger::instance().close_output_file();
    }

    ResponseBuilder run(HttpMethod method, const std::string& path) {
        RequestContext ctx;
        ctx.set_method(method);
        ctx.set_path(path);
        return chain_.resolve(path, &handler_).run(ctx, ResponseBuilder());
    }
};

TEST_F(AccessLoggerTest, FormatAllParts) {
    EXPECT_EQ(middlewares::format_access_line({}, "/users", 3, "GET"),
              "path: /users, Time taken: 3ms, method: GET");
}

TEST_F(AccessLoggerTest, FormatSelectedParts) {
    middlewares::LoggerConfig no_duration;
    no_duration.duration = false;
    EXPECT_EQ(middlewares::format_access_line(no_duration, "/a", 9, "POST"),
              "path: /a, method: POST");

    middlewares::LoggerConfig only_path;
    only_path.method = false;
    only_path.duration = false;
    EXPECT_EQ(middlewares::format_access_line(only_path, "/a", 9, "POST"), "path: /a, ");

    middlewares::LoggerConfig nothing{false, false, false};
    EXPECT_EQ(middlewares::format_access_line(nothing, "/a", 9, "POST"), "");
}

TEST_F(AccessLoggerTest, LogsAfterDownstreamAndPassesResponseThrough) {
    chain_.add("", middlewares::logger());

    std::string path = rng_.random_path();
    ResponseBuilder res = run(HttpMethod::PUT, path);
    EXPECT_EQ(res.status_code(), 201);
    EXPECT_EQ(res.body(), "made");

    std::string out = file_.read();
    EXPECT_THAT(out, HasSubstr("[Access] path: " + path + ", Time taken: "));
    EXPECT_THAT(out, HasSubstr("ms, method: PUT"));
}

TEST_F(AccessLoggerTest, LogsShortCircuitedRequests) {
    chain_.add("", middlewares::logger());
    chain_.add("/blocked", [](const RequestContext&, ResponseBuilder res, Next) {
        return res.status(403);
    });

    EXPECT_EQ(run(HttpMethod::GET, "/blocked/x").status_code(), 403);
    EXPECT_THAT(file_.read(), HasSubstr("path: /blocked/x"));
}

TEST_F(AccessLoggerTest, PrefixScopedLogger) {
    middlewares::LoggerConfig config;
    config.duration = false;
    chain_.add("/api", middlewares::logger(config));

    run(HttpMethod::GET, "/public");
    run(HttpMethod::DELETE, "/api/items");

    std::string out = file_.read();
    EXPECT_THAT(out, Not(HasSubstr("/public")));
    EXPECT_THAT(out, HasSubstr("path: /api/items, method: DELETE"));
}

TEST_F(AccessLoggerTest, SilencedByLevel) {
    core::Logger::instance().set_level(core::LogLevel::WARN);
    chain_.add("", middlewares::logger());

    run(HttpMethod::GET, "/quiet");
    EXPECT_THAT(file_.read(), Not(HasSubstr("/quiet")));
    core::Logger::instance().set_level(core::LogLevel::INFO);
}
