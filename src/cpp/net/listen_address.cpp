#include "listen_address.h"

#include <charconv>

namespace ripcord {
namespace net {

core::result<ListenAddress> parse_listen_address(std::string_view address) {
    size_t colon = address.rfind(':');
    if (colon == std::string_view::npos) {
        return core::err<ListenAddress>(core::error_code::invalid_address,
                                        "missing port in address: " + std::string(address));
    }

    std::string_view host = address.substr(0, colon);
    std::string_view port_text = address.substr(colon + 1);

    if (host.empty()) {
        return core::err<ListenAddress>(core::error_code::invalid_address,
                                        "missing host in address: " + std::string(address));
    }
    if (port_text.empty() || port_text.size() > 5) {
        return core::err<ListenAddress>(core::error_code::invalid_address,
                                        "invalid port in address: " + std::string(address));
    }

    unsigned int port = 0;
    auto [end, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
    if (ec != std::errc() || end != port_text.data() + port_text.size() || port > 65535) {
        return core::err<ListenAddress>(core::error_code::invalid_address,
                                        "invalid port in address: " + std::string(address));
    }

    ListenAddress parsed;
    parsed.host = host == "localhost" ? "127.0.0.1" : std::string(host);
    parsed.port = static_cast<uint16_t>(port);
    return parsed;
}

} // namespace net
} // namespace ripcord
