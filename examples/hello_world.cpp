/**
 * @file hello_world.cpp
 * @brief Small ripcord application: a few routes, a guard and access logging
 *
 * Build and run:
 * @code
 * cmake -S . -B build && cmake --build build --target ripcord_hello
 * ./build/ripcord_hello 127.0.0.1:8000
 * @endcode
 *
 * Then:
 *   curl http://localhost:8000/
 *   curl http://localhost:8000/users/42?verbose=1
 *   curl -X POST -H 'Content-Type: application/json' -d '{"name":"ada","age":36}' \
 *        http://localhost:8000/users
 */

#include "../src/cpp/core/logger.h"
#include "../src/cpp/http/app.h"
#include "../src/cpp/middlewares/logger.h"

#include <csignal>
#include <cstdlib>

using namespace ripcord;
using namespace ripcord::http;

namespace {

struct User {
    std::string name;
    int age = 0;
};

core::result<void> from_json(const JsonValue& in, User& out) {
    auto r = read_field(in, "name", out.name);
    if (!r) return r;
    return read_field(in, "age", out.age);
}

JsonValue to_json(const User& user) {
    JsonValue out = JsonValue::object();
    out["name"] = user.name;
    out["age"] = user.age;
    return out;
}

App* g_app = nullptr;

void on_signal(int) {
    if (g_app) {
        g_app->stop();
    }
}

} // namespace

int main(int argc, char** argv) {
    const char* level = std::getenv("RIPCORD_LOG_LEVEL");
    if (level) {
        auto parsed = core::parse_log_level(level);
        if (parsed) {
            core::Logger::instance().set_level(parsed.value());
        }
    }

    App::Config config;
    config.name = "hello";
    App app(config);

    app.use(middlewares::logger());

    // Reject /admin requests without a token
    app.use("/admin", [](const RequestContext& req, ResponseBuilder res, Next next) {
        if (!req.get_header("Authorization")) {
            return res.status(401).json(JsonValue::object());
        }
        return next.run(req, res);
    });

    app.get("/", [](const RequestContext&, ResponseBuilder res) {
        JsonValue body = JsonValue::object();
        body["message"] = "Hello, World!";
        body["from"] = "ripcord";
        return res.json(body);
    });

    app.get("/users/{id}", [](const RequestContext& req, ResponseBuilder res) {
        JsonValue body = JsonValue::object();
        body["id"] = req.get_param("id").value_or("");
        body["verbose"] = req.get_query("verbose").has_value();
        return res.json(body);
    });

    app.post("/users", [](const RequestContext& req, ResponseBuilder res) {
        auto user = req.json<User>();
        if (!user) {
            return error_response(res, 400, user.get_error().describe());
        }
        return res.status(201).json(user.value());
    });

    app.get("/admin/stats", [](const RequestContext&, ResponseBuilder res) {
        return res.text("all good");
    });

    g_app = &app;
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    return app.listen(argc > 1 ? argv[1] : "0.0.0.0:8000");
}
