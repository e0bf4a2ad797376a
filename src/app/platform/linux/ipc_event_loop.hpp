#pragma once

#include "dispatcher.hpp"
#include "platform/ipc_server.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

// Serves every listener from one epoll loop. Each connection carries exactly
// one request: read a frame, dispatch, write the response, close.
class IpcEventLoop {
public:
    IpcEventLoop(std::vector<std::unique_ptr<IpcServer>> servers,
                 CommandDispatcher& dispatcher,
                 std::chrono::milliseconds shutdown_grace,
                 bool verbose = false);
    ~IpcEventLoop();

    IpcEventLoop(const IpcEventLoop&) = delete;
    IpcEventLoop& operator=(const IpcEventLoop&) = delete;

    bool init();

    // Blocks until request_stop(). On the way out listeners are closed first,
    // then in-flight connections get the grace period to finish.
    void run();

    // Safe to call from any thread.
    void request_stop();

    size_t listener_count() const { return servers_.size(); }

private:
    struct Client {
        int fd;
        IpcServer* server;
    };

    void accept_all(IpcServer& server);
    void handle_client(int fd);
    void finish_client(int fd);
    void drain_clients();
    IpcServer* find_server(int fd);
    Client* find_client(int fd);

    void log(const std::string& msg);

    std::vector<std::unique_ptr<IpcServer>> servers_;
    CommandDispatcher& dispatcher_;
    std::chrono::milliseconds shutdown_grace_;
    bool verbose_;

    int epoll_fd_ = -1;
    int wake_fd_ = -1;

    std::atomic<bool> running_{false};
    std::vector<Client> clients_;
};
