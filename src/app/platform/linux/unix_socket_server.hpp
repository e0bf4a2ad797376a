#pragma once

#include "platform/linux/stream_socket_server.hpp"

#include <sys/types.h>

// Listener on a filesystem socket, reachable only by the owning user.
class UnixSocketServer : public StreamSocketServer {
public:
    explicit UnixSocketServer(size_t max_frame_bytes);
    ~UnixSocketServer() override;

    // A leftover socket at endpoint is probed first: if something answers the
    // result is AlreadyRunning, otherwise the stale file is replaced.
    ListenResult start(const std::string& endpoint) override;

protected:
    void release_address() override;

private:
    std::string socket_path_;
    ino_t socket_ino_ = 0;
};
