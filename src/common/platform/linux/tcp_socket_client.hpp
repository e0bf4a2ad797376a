#pragma once

#include "platform/linux/stream_socket_client.hpp"

// Endpoint is "host:port" with an IPv4 host.
class TcpSocketClient : public StreamSocketClient {
public:
    bool connect(const std::string& endpoint) override;
};
