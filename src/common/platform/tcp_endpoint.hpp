#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

struct TcpEndpoint {
    std::string host;
    uint16_t port = 0;
};

// "host:port", IPv4 only.
std::expected<TcpEndpoint, std::string> parse_tcp_endpoint(std::string_view endpoint);
std::string format_tcp_endpoint(const TcpEndpoint& ep);
