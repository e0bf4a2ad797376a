#include "platform/linux/tcp_socket_client.hpp"

#include "platform/tcp_endpoint.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

bool TcpSocketClient::connect(const std::string& endpoint) {
    close();

    auto ep = parse_tcp_endpoint(endpoint);
    if (!ep) return false;

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(ep->port);
    if (::inet_pton(AF_INET, ep->host.c_str(), &addr.sin_addr) != 1) return false;

    fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) return false;

    if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd_);
        fd_ = -1;
        return false;
    }
    return true;
}
