/**
 * @file route_registry_test.cpp
 * @brief Google Test suite for RouteRegistry registration and dispatch
 *
 * Tests:
 * - Exact literal matching
 * - Method selection
 * - {param} captures
 * - First-registered wins
 * - Registration validation
 */

#include <gtest/gtest.h>
#include "../test_utils.h"
#include "../../src/cpp/http/route_registry.h"

#include <set>
#include <string>
#include <vector>

using namespace ripcord::http;
namespace core = ripcord::core;

class RouteRegistryTest : public RipcordTest {
protected:
    RouteRegistry registry_;

    static Handler tagged(const std::string& tag) {
        return [tag](const RequestContext&, ResponseBuilder res) {
            return res.text(tag);
        };
    }

    std::string run(HttpMethod method, const std::string& path) {
        auto match = registry_.dispatch(method, path);
        if (!match) {
            return "<none>";
        }
        RequestContext ctx;
        return (*match.value().handler)(ctx, ResponseBuilder()).body();
    }
};

// =============================================================================
// Literal paths
// =============================================================================

TEST_F(RouteRegistryTest, ExactMatch) {
    ASSERT_TRUE(registry_.add_route(HttpMethod::GET, "/", tagged("root")).is_ok());
    ASSERT_TRUE(registry_.add_route(HttpMethod::GET, "/users", tagged("users")).is_ok());

    EXPECT_EQ(run(HttpMethod::GET, "/"), "root");
    EXPECT_EQ(run(HttpMethod::GET, "/users"), "users");
    EXPECT_EQ(run(HttpMethod::GET, "/Users"), "<none>");
    EXPECT_EQ(run(HttpMethod::GET, "/users/"), "<none>");
    EXPECT_EQ(run(HttpMethod::GET, "/users/1"), "<none>");
}

TEST_F(RouteRegistryTest, NotFound) {
    auto match = registry_.dispatch(HttpMethod::GET, "/nothing");
    ASSERT_TRUE(match.is_err());
    EXPECT_EQ(match.error(), core::error_code::not_found);
    EXPECT_EQ(match.get_error().describe(), "Not Found");
}

TEST_F(RouteRegistryTest, MethodSelectsRoute) {
    registry_.add_route(HttpMethod::GET, "/items", tagged("list"));
    registry_.add_route(HttpMethod::POST, "/items", tagged("create"));
    registry_.add_route(HttpMethod::DELETE, "/items", tagged("purge"));

    EXPECT_EQ(run(HttpMethod::GET, "/items"), "list");
    EXPECT_EQ(run(HttpMethod::POST, "/items"), "create");
    EXPECT_EQ(run(HttpMethod::DELETE, "/items"), "purge");
    EXPECT_EQ(run(HttpMethod::PUT, "/items"), "<none>");
    EXPECT_EQ(run(HttpMethod::PATCH, "/items"), "<none>");
}

TEST_F(RouteRegistryTest, FirstRegistrationWins) {
    registry_.add_route(HttpMethod::GET, "/dup", tagged("first"));
    registry_.add_route(HttpMethod::GET, "/dup", tagged("second"));

    EXPECT_EQ(registry_.size(), 2u);
    EXPECT_EQ(run(HttpMethod::GET, "/dup"), "first");
}

TEST_F(RouteRegistryTest, RandomLiteralPaths) {
    std::set<std::string> paths;
    while (paths.size() < 50) {
        paths.insert(rng_.random_path());
    }
    for (const auto& path : paths) {
        ASSERT_TRUE(registry_.add_route(HttpMethod::GET, path, tagged(path)).is_ok()) << path;
    }

    std::vector<std::string> order(paths.begin(), paths.end());
    rng_.shuffle(order);
    for (const auto& path : order) {
        EXPECT_EQ(run(HttpMethod::GET, path), path);
    }
}

// =============================================================================
// Parameters
// =============================================================================

TEST_F(RouteRegistryTest, ParamCapture) {
    registry_.add_route(HttpMethod::GET, "/users/{id}", tagged("user"));
    registry_.add_route(HttpMethod::GET, "/users/{id}/posts/{post}", tagged("post"));

    std::string id = rng_.random_string(8);
    auto match = registry_.dispatch(HttpMethod::GET, "/users/" + id);
    ASSERT_TRUE(match.is_ok());
    EXPECT_EQ(match.value().params.size(), 1u);
    EXPECT_EQ(match.value().params.at("id"), id);

    auto nested = registry_.dispatch(HttpMethod::GET, "/users/7/posts/hello");
    ASSERT_TRUE(nested.is_ok());
    EXPECT_EQ(nested.value().params.at("id"), "7");
    EXPECT_EQ(nested.value().params.at("post"), "hello");
}

TEST_F(RouteRegistryTest, ParamNeedsNonEmptySegment) {
    registry_.add_route(HttpMethod::GET, "/users/{id}", tagged("user"));

    EXPECT_EQ(run(HttpMethod::GET, "/users/"), "<none>");
    EXPECT_EQ(run(HttpMethod::GET, "/users"), "<none>");
    EXPECT_EQ(run(HttpMethod::GET, "/users/1/extra"), "<none>");
    EXPECT_EQ(run(HttpMethod::GET, "/users/1"), "user");
}

TEST_F(RouteRegistryTest, LiteralBeforeParamWhenRegisteredFirst) {
    registry_.add_route(HttpMethod::GET, "/users/me", tagged("me"));
    registry_.add_route(HttpMethod::GET, "/users/{id}", tagged("by-id"));

    EXPECT_EQ(run(HttpMethod::GET, "/users/me"), "me");
    EXPECT_EQ(run(HttpMethod::GET, "/users/42"), "by-id");
}

TEST_F(RouteRegistryTest, ParamRegisteredFirstShadowsLiteral) {
    registry_.add_route(HttpMethod::GET, "/users/{id}", tagged("by-id"));
    registry_.add_route(HttpMethod::GET, "/users/me", tagged("me"));

    EXPECT_EQ(run(HttpMethod::GET, "/users/me"), "by-id");
}

TEST_F(RouteRegistryTest, LiteralRouteHasNoParams) {
    registry_.add_route(HttpMethod::GET, "/health", tagged("ok"));
    auto match = registry_.dispatch(HttpMethod::GET, "/health");
    ASSERT_TRUE(match.is_ok());
    EXPECT_TRUE(match.value().params.empty());
}

// =============================================================================
// Validation
// =============================================================================

TEST_F(RouteRegistryTest, RejectsBadRegistrations) {
    auto relative = registry_.add_route(HttpMethod::GET, "users", tagged("x"));
    EXPECT_EQ(relative.error(), core::error_code::bad_request);

    auto empty = registry_.add_route(HttpMethod::GET, "", tagged("x"));
    EXPECT_EQ(empty.error(), core::error_code::bad_request);

    auto no_handler = registry_.add_route(HttpMethod::GET, "/x", Handler());
    EXPECT_EQ(no_handler.error(), core::error_code::bad_request);

    auto unterminated = registry_.add_route(HttpMethod::GET, "/users/{id", tagged("x"));
    EXPECT_EQ(unterminated.error(), core::error_code::bad_request);

    auto unnamed = registry_.add_route(HttpMethod::GET, "/users/{}", tagged("x"));
    EXPECT_EQ(unnamed.error(), core::error_code::bad_request);

    EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(RouteRegistryTest, RoutesListInRegistrationOrder) {
    registry_.add_route(HttpMethod::POST, "/b", tagged("b"));
    registry_.add_route(HttpMethod::GET, "/a", tagged("a"));

    auto routes = registry_.routes();
    ASSERT_EQ(routes.size(), 2u);
    EXPECT_EQ(routes[0].method, HttpMethod::POST);
    EXPECT_EQ(routes[0].path, "/b");
    EXPECT_EQ(routes[1].method, HttpMethod::GET);
    EXPECT_EQ(routes[1].path, "/a");
}
