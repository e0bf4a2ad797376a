#include "platform/linux/tcp_socket_server.hpp"

#include "platform/tcp_endpoint.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <print>
#include <sys/socket.h>
#include <unistd.h>

TcpSocketServer::TcpSocketServer(size_t max_frame_bytes)
    : StreamSocketServer(max_frame_bytes) {}

TcpSocketServer::~TcpSocketServer() {
    stop();
}

ListenResult TcpSocketServer::start(const std::string& endpoint) {
    auto ep = parse_tcp_endpoint(endpoint);
    if (!ep) {
        std::println(stderr, "tcp: {}", ep.error());
        return ListenResult::Failed;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(ep->port);
    if (::inet_pton(AF_INET, ep->host.c_str(), &addr.sin_addr) != 1) {
        std::println(stderr, "tcp: invalid address {}", ep->host);
        return ListenResult::Failed;
    }
    // 127.0.0.0/8 only; never a wildcard or routable address.
    if ((ntohl(addr.sin_addr.s_addr) >> 24) != 127) {
        std::println(stderr, "tcp: refusing to listen on non-loopback address {}", ep->host);
        return ListenResult::Failed;
    }

    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        std::println(stderr, "tcp: socket() failed: {}", std::strerror(errno));
        return ListenResult::Failed;
    }

    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::println(stderr, "tcp: bind() {} failed: {}", endpoint, std::strerror(errno));
        ::close(fd);
        return ListenResult::Failed;
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    }

    return finish_start(fd, format_tcp_endpoint({.host = ep->host, .port = bound_port_}));
}
