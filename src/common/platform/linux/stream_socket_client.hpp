#pragma once

#include "platform/ipc_client.hpp"

// Framing shared by the Unix-socket and loopback TCP clients.
class StreamSocketClient : public IpcClient {
public:
    StreamSocketClient();
    ~StreamSocketClient() override;

    StreamSocketClient(const StreamSocketClient&) = delete;
    StreamSocketClient& operator=(const StreamSocketClient&) = delete;

    bool send(std::string_view frame) override;
    bool recv(std::string& line, int timeout_ms = 2000) override;
    void close() override;

    bool connected() const { return fd_ >= 0; }

protected:
    int fd_ = -1;
};
