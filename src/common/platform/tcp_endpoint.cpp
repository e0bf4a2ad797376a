#include "platform/tcp_endpoint.hpp"

#include <charconv>
#include <format>

std::expected<TcpEndpoint, std::string> parse_tcp_endpoint(std::string_view endpoint) {
    auto colon = endpoint.rfind(':');
    if (colon == std::string_view::npos || colon == 0) {
        return std::unexpected(std::format("bad endpoint '{}': expected host:port", endpoint));
    }

    auto port_str = endpoint.substr(colon + 1);
    uint16_t port = 0;
    auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
    if (ec != std::errc{} || ptr != port_str.data() + port_str.size()) {
        return std::unexpected(std::format("bad endpoint '{}': invalid port", endpoint));
    }

    return TcpEndpoint{.host = std::string(endpoint.substr(0, colon)), .port = port};
}

std::string format_tcp_endpoint(const TcpEndpoint& ep) {
    return std::format("{}:{}", ep.host, ep.port);
}
