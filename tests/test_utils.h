/**
 * @file test_utils.h
 * @brief Test utilities for the ripcord Google Test suites
 *
 * Provides:
 * - RandomGenerator: randomized paths, header values, query strings and bodies
 * - FakeTransportRequest: in-memory TransportRequest with configurable chunking
 * - RipcordTest: base fixture with a fresh generator per test
 * - TempFile: scratch file removed on destruction (log capture)
 */

#pragma once

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "http/transport.h"
#include "core/result.h"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>
#include <unistd.h>

namespace ripcord {
namespace testing {

/**
 * @class RandomGenerator
 * @brief Generate randomized test data
 */
class RandomGenerator {
public:
    RandomGenerator() : rng_(std::random_device{}()) {}

    explicit RandomGenerator(uint64_t seed) : rng_(seed) {}

    /**
     * Random alphanumeric string of the given length
     */
    std::string random_string(size_t len) {
        static constexpr char chars[] =
            "abcdefghijklmnopqrstuvwxyz"
            "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
            "0123456789";
        std::uniform_int_distribution<size_t> dist(0, sizeof(chars) - 2);

        std::string result;
        result.reserve(len);
        for (size_t i = 0; i < len; ++i) {
            result += chars[dist(rng_)];
        }
        return result;
    }

    /**
     * Random literal URL path, e.g. /api/v1/users/abc123
     */
    std::string random_path() {
        static const std::vector<std::string> prefixes = {
            "/", "/api/", "/api/v1/", "/v2/"
        };
        static const std::vector<std::string> resources = {
            "users", "items", "posts", "orders", "health", "status"
        };

        std::string path = pick(prefixes);
        int depth = random_int(1, 3);
        for (int i = 0; i < depth; ++i) {
            path += pick(resources);
            if (random_bool()) {
                path += "/" + random_string(8);
            }
            if (i < depth - 1) {
                path += "/";
            }
        }
        return path;
    }

    /**
     * Random "k=v&k=v" query string with n distinct keys
     */
    std::string random_query(size_t n, std::unordered_map<std::string, std::string>* out = nullptr) {
        std::string query;
        for (size_t i = 0; i < n; ++i) {
            std::string key = "k" + std::to_string(i) + random_string(4);
            std::string value = random_string(random_size(0, 12));
            if (!query.empty()) {
                query += '&';
            }
            query += key + "=" + value;
            if (out) {
                (*out)[key] = value;
            }
        }
        return query;
    }

    /**
     * Random JSON object body with id, name, value and active fields
     */
    std::string random_json_body() {
        std::ostringstream oss;
        oss << R"({"id":")" << random_string(8) << R"(",)";
        oss << R"("name":")" << random_string(16) << R"(",)";
        oss << R"("value":)" << random_int(0, 10000) << R"(,)";
        oss << R"("active":)" << (random_bool() ? "true" : "false") << "}";
        return oss.str();
    }

    std::string random_ipv4() {
        return std::to_string(random_int(1, 254)) + "." + std::to_string(random_int(0, 255)) + "." +
               std::to_string(random_int(0, 255)) + "." + std::to_string(random_int(1, 254));
    }

    int random_int(int min, int max) {
        std::uniform_int_distribution<int> dist(min, max);
        return dist(rng_);
    }

    size_t random_size(size_t min, size_t max) {
        std::uniform_int_distribution<size_t> dist(min, max);
        return dist(rng_);
    }

    bool random_bool() {
        std::uniform_int_distribution<int> dist(0, 1);
        return dist(rng_) == 1;
    }

    template<typename T>
    void shuffle(std::vector<T>& vec) {
        std::shuffle(vec.begin(), vec.end(), rng_);
    }

    template<typename T>
    const T& pick(const std::vector<T>& vec) {
        std::uniform_int_distribution<size_t> dist(0, vec.size() - 1);
        return vec[dist(rng_)];
    }

private:
    std::mt19937_64 rng_;
};

/**
 * @class FakeTransportRequest
 * @brief In-memory TransportRequest
 *
 * The body is handed out in chunks of chunk_size bytes. fail_after_chunks
 * makes read_chunk() fail with io_error once that many chunks were served.
 */
class FakeTransportRequest : public http::TransportRequest {
public:
    std::string method_ = "GET";
    std::string path_ = "/";
    std::string query_;
    http::HeaderList headers_;
    http::HeaderList cookies_;
    std::unordered_map<std::string, std::string> params_;
    std::string body_;
    std::optional<std::string> peer_;

    size_t chunk_size = 4096;
    std::optional<size_t> fail_after_chunks;

    size_t chunks_served = 0;
    size_t bytes_served = 0;

    FakeTransportRequest() = default;

    FakeTransportRequest(std::string method, std::string path)
        : method_(std::move(method)), path_(std::move(path)) {}

    FakeTransportRequest& header(const std::string& name, const std::string& value) {
        headers_.emplace_back(name, value);
        return *this;
    }

    FakeTransportRequest& cookie(const std::string& name, const std::string& value) {
        cookies_.emplace_back(name, value);
        return *this;
    }

    FakeTransportRequest& body(std::string bytes) {
        body_ = std::move(bytes);
        return *this;
    }

    std::string method() const override { return method_; }
    std::string path() const override { return path_; }
    std::string query_string() const override { return query_; }
    http::HeaderList headers() const override { return headers_; }
    http::HeaderList cookies() const override { return cookies_; }
    std::unordered_map<std::string, std::string> params() const override { return params_; }
    std::optional<std::string> peer_address() const override { return peer_; }

    core::result<bool> read_chunk(std::string& chunk) override {
        if (fail_after_chunks && chunks_served >= *fail_after_chunks) {
            return core::err<bool>(core::error_code::io_error, "stream reset");
        }
        if (bytes_served >= body_.size()) {
            return false;
        }
        size_t n = std::min(chunk_size, body_.size() - bytes_served);
        chunk.assign(body_, bytes_served, n);
        bytes_served += n;
        ++chunks_served;
        return true;
    }
};

/**
 * @class TempFile
 * @brief Unique scratch file path, removed on destruction
 */
class TempFile {
public:
    TempFile() {
        char name[] = "/tmp/ripcord_test_XXXXXX";
        int fd = ::mkstemp(name);
        if (fd >= 0) {
            ::close(fd);
        }
        path_ = name;
    }

    ~TempFile() {
        std::remove(path_.c_str());
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return path_; }

    std::string read() const {
        std::ifstream in(path_);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

private:
    std::string path_;
};

/**
 * @class RipcordTest
 * @brief Base test fixture
 */
class RipcordTest : public ::testing::Test {
protected:
    RandomGenerator rng_;

    void SetUp() override {
        // Reset RNG with random seed for each test
        rng_ = RandomGenerator();
    }
};

} // namespace testing
} // namespace ripcord

// Bring testing namespace into global scope for convenience
using namespace ripcord::testing;
