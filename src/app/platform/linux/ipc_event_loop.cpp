#include "platform/linux/ipc_event_loop.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <exception>
#include <print>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>

IpcEventLoop::IpcEventLoop(std::vector<std::unique_ptr<IpcServer>> servers,
                           CommandDispatcher& dispatcher,
                           std::chrono::milliseconds shutdown_grace,
                           bool verbose)
    : servers_(std::move(servers)), dispatcher_(dispatcher),
      shutdown_grace_(shutdown_grace), verbose_(verbose) {}

IpcEventLoop::~IpcEventLoop() {
    for (auto& c : clients_) {
        c.server->close_client(c.fd);
    }
    clients_.clear();
    for (auto& s : servers_) {
        s->stop();
    }
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (wake_fd_ >= 0) ::close(wake_fd_);
}

bool IpcEventLoop::init() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "ipc: epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        std::println(stderr, "ipc: eventfd failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd) {
        epoll_event ev{.events = EPOLLIN, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(wake_fd_)) {
        std::println(stderr, "ipc: epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }
    for (auto& s : servers_) {
        if (!add_fd(s->server_fd())) {
            std::println(stderr, "ipc: cannot watch {}: {}", s->endpoint(), std::strerror(errno));
            return false;
        }
        log("listening on " + s->endpoint());
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void IpcEventLoop::run() {
    constexpr int MAX_EVENTS = 64;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_acquire)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "ipc: epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == wake_fd_) {
                uint64_t val;
                ::read(wake_fd_, &val, sizeof(val));
                running_.store(false, std::memory_order_release);
                break;
            }

            if (auto* server = find_server(fd)) {
                accept_all(*server);
                continue;
            }

            handle_client(fd);
        }
    }

    // Stop accepting and release the socket path right away, then let
    // in-flight requests finish.
    for (auto& s : servers_) {
        s->stop_listening();
    }
    drain_clients();
    for (auto& s : servers_) {
        s->stop();
    }
    log("ipc stopped");
}

void IpcEventLoop::request_stop() {
    if (wake_fd_ >= 0) {
        uint64_t val = 1;
        ::write(wake_fd_, &val, sizeof(val));
    } else {
        running_.store(false, std::memory_order_release);
    }
}

void IpcEventLoop::accept_all(IpcServer& server) {
    int client_fd;
    while ((client_fd = server.accept_client()) >= 0) {
        epoll_event ev{.events = EPOLLIN | EPOLLRDHUP, .data = {.fd = client_fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) < 0) {
            log(std::string("dropping connection, epoll_ctl failed: ") + std::strerror(errno));
            server.close_client(client_fd);
            continue;
        }
        clients_.push_back({client_fd, &server});
    }
}

void IpcEventLoop::handle_client(int fd) {
    auto* client = find_client(fd);
    if (!client) return;
    auto& server = *client->server;

    std::string line;
    switch (server.read_frame(fd, line)) {
        case ReadResult::Pending:
            return;

        case ReadResult::Closed:
            log("connection on " + server.endpoint() + " closed before a full request");
            finish_client(fd);
            return;

        case ReadResult::Overflow:
            log("request on " + server.endpoint() + " too large");
            server.send_frame(fd, protocol::encode(Response::failure("request too large")));
            finish_client(fd);
            return;

        case ReadResult::Frame:
            break;
    }

    Response response;
    try {
        auto cmd = protocol::decode_command(line);
        if (cmd) {
            response = dispatcher_.dispatch(*cmd);
        } else {
            log("rejected request: " + cmd.error());
            response = Response::failure(cmd.error());
        }
    } catch (const std::exception& e) {
        response = Response::failure(std::string("internal error: ") + e.what());
    }

    if (!server.send_frame(fd, protocol::encode(response))) {
        log("could not deliver response on " + server.endpoint());
    }
    finish_client(fd);
}

void IpcEventLoop::finish_client(int fd) {
    auto it = std::ranges::find_if(clients_, [fd](const Client& c) { return c.fd == fd; });
    if (it == clients_.end()) return;

    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    it->server->close_client(fd);
    clients_.erase(it);
}

void IpcEventLoop::drain_clients() {
    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() + shutdown_grace_;

    constexpr int MAX_EVENTS = 64;
    epoll_event events[MAX_EVENTS];

    while (!clients_.empty()) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
        if (remaining.count() <= 0) break;

        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, static_cast<int>(remaining.count()));
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;
            if (fd == wake_fd_) {
                uint64_t val;
                ::read(wake_fd_, &val, sizeof(val));
                continue;
            }
            handle_client(fd);
        }
    }

    if (!clients_.empty()) {
        log(std::to_string(clients_.size()) + " connection(s) dropped at shutdown");
    }
    while (!clients_.empty()) {
        finish_client(clients_.back().fd);
    }
}

IpcServer* IpcEventLoop::find_server(int fd) {
    for (auto& s : servers_) {
        if (s->server_fd() == fd) return s.get();
    }
    return nullptr;
}

IpcEventLoop::Client* IpcEventLoop::find_client(int fd) {
    auto it = std::ranges::find_if(clients_, [fd](const Client& c) { return c.fd == fd; });
    return it != clients_.end() ? &*it : nullptr;
}

void IpcEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[arandu] {}", msg);
    }
}
