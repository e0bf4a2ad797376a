#include "platform/linux/stream_socket_server.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <print>
#include <sys/socket.h>
#include <unistd.h>

namespace {

constexpr int SEND_TIMEOUT_MS = 1000;

} // namespace

StreamSocketServer::StreamSocketServer(size_t max_frame_bytes)
    : max_frame_bytes_(max_frame_bytes) {}

StreamSocketServer::~StreamSocketServer() {
    stop();
}

ListenResult StreamSocketServer::finish_start(int fd, std::string endpoint) {
    if (::listen(fd, SOMAXCONN) < 0) {
        std::println(stderr, "ipc: listen() on {} failed: {}", endpoint, std::strerror(errno));
        ::close(fd);
        return ListenResult::Failed;
    }
    server_fd_ = fd;
    endpoint_ = std::move(endpoint);
    return ListenResult::Listening;
}

void StreamSocketServer::stop_listening() {
    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
        release_address();
    }
}

void StreamSocketServer::stop() {
    for (auto& c : clients_) {
        ::close(c.fd);
    }
    clients_.clear();
    stop_listening();
}

int StreamSocketServer::accept_client() {
    if (server_fd_ < 0) return -1;
    int fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) return -1;
    clients_.push_back({fd, {}});
    return fd;
}

ReadResult StreamSocketServer::read_frame(int client_fd, std::string& line) {
    auto* client = find_client(client_fd);
    if (!client) return ReadResult::Closed;

    char buf[4096];
    while (true) {
        auto pos = client->buf.find('\n');
        if (pos != std::string::npos) {
            if (pos > max_frame_bytes_) return ReadResult::Overflow;
            line = client->buf.substr(0, pos);
            client->buf.erase(0, pos + 1);
            return ReadResult::Frame;
        }
        if (client->buf.size() > max_frame_bytes_) return ReadResult::Overflow;

        ssize_t n = ::recv(client_fd, buf, sizeof(buf), 0);
        if (n > 0) {
            client->buf.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return ReadResult::Pending;
        // Half-closed after an unterminated last line: that line is the frame.
        if (n == 0 && !client->buf.empty()) {
            line = std::move(client->buf);
            client->buf.clear();
            return ReadResult::Frame;
        }
        return ReadResult::Closed;
    }
}

bool StreamSocketServer::send_frame(int client_fd, std::string_view frame) {
    while (!frame.empty()) {
        ssize_t sent = ::send(client_fd, frame.data(), frame.size(), MSG_NOSIGNAL);
        if (sent >= 0) {
            frame.remove_prefix(static_cast<size_t>(sent));
            continue;
        }
        if (errno == EINTR) continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK) return false;

        pollfd pfd{.fd = client_fd, .events = POLLOUT, .revents = 0};
        if (::poll(&pfd, 1, SEND_TIMEOUT_MS) <= 0) return false;
    }
    return true;
}

void StreamSocketServer::close_client(int client_fd) {
    // Discard anything the peer sent after its request so the close is a
    // FIN rather than a reset that could destroy the unread response.
    ::shutdown(client_fd, SHUT_WR);
    char buf[4096];
    for (int i = 0; i < 16 && ::recv(client_fd, buf, sizeof(buf), 0) > 0; ++i) {}

    ::close(client_fd);
    std::erase_if(clients_, [client_fd](const ClientBuffer& c) { return c.fd == client_fd; });
}

StreamSocketServer::ClientBuffer* StreamSocketServer::find_client(int fd) {
    auto it = std::ranges::find_if(clients_, [fd](const ClientBuffer& c) { return c.fd == fd; });
    return it != clients_.end() ? &*it : nullptr;
}
