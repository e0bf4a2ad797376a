#pragma once

#include "platform/ipc_server.hpp"

#include <cstddef>
#include <string>
#include <vector>

// Accept/read/write plumbing shared by the Unix socket and loopback TCP
// listeners. Subclasses only bind.
class StreamSocketServer : public IpcServer {
public:
    explicit StreamSocketServer(size_t max_frame_bytes);
    ~StreamSocketServer() override;

    StreamSocketServer(const StreamSocketServer&) = delete;
    StreamSocketServer& operator=(const StreamSocketServer&) = delete;

    void stop_listening() override;
    void stop() override;
    int server_fd() const override { return server_fd_; }
    const std::string& endpoint() const override { return endpoint_; }
    int accept_client() override;
    ReadResult read_frame(int client_fd, std::string& line) override;
    bool send_frame(int client_fd, std::string_view frame) override;
    void close_client(int client_fd) override;

    size_t client_count() const { return clients_.size(); }

protected:
    // Called after the listening fd is closed.
    virtual void release_address() {}

    // Shared tail of start(): listen() and bookkeeping.
    ListenResult finish_start(int fd, std::string endpoint);

    int server_fd_ = -1;
    std::string endpoint_;

private:
    struct ClientBuffer {
        int fd;
        std::string buf;
    };
    std::vector<ClientBuffer> clients_;
    size_t max_frame_bytes_;

    ClientBuffer* find_client(int fd);
};
