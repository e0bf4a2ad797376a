#pragma once

#include "platform/linux/stream_socket_server.hpp"

#include <cstdint>

// Loopback-only TCP listener. A fixed port can be taken by an unrelated
// program, so bind failure is routine and reported as Failed.
class TcpSocketServer : public StreamSocketServer {
public:
    explicit TcpSocketServer(size_t max_frame_bytes);
    ~TcpSocketServer() override;

    // endpoint is "127.0.0.1:<port>"; port 0 picks an ephemeral port.
    ListenResult start(const std::string& endpoint) override;

    uint16_t bound_port() const { return bound_port_; }

private:
    uint16_t bound_port_ = 0;
};
