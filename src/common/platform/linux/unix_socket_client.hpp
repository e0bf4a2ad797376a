#pragma once

#include "platform/linux/stream_socket_client.hpp"

class UnixSocketClient : public StreamSocketClient {
public:
    bool connect(const std::string& endpoint) override;
};
