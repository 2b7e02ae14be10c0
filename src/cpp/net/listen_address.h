#pragma once

#include "core/result.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace ripcord {
namespace net {

/**
 * host:port pair accepted by App::listen().
 */
struct ListenAddress {
    std::string host;
    uint16_t port{0};  // 0 = ephemeral

    std::string to_string() const { return host + ":" + std::to_string(port); }
};

/**
 * Parse "host:port".
 *
 * The port must be decimal in 0..65535; the host must be non-empty.
 * "localhost" is mapped to 127.0.0.1. Anything else fails with
 * invalid_address.
 */
core::result<ListenAddress> parse_listen_address(std::string_view address);

} // namespace net
} // namespace ripcord
