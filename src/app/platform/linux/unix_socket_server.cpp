#include "platform/linux/unix_socket_server.hpp"

#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <print>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

bool peer_listening(const std::string& path) {
    UnixSocketClient probe;
    return probe.connect(path);
}

} // namespace

UnixSocketServer::UnixSocketServer(size_t max_frame_bytes)
    : StreamSocketServer(max_frame_bytes) {}

UnixSocketServer::~UnixSocketServer() {
    stop();
}

ListenResult UnixSocketServer::start(const std::string& endpoint) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (endpoint.size() >= sizeof(addr.sun_path)) {
        std::println(stderr, "ipc: socket path too long: {}", endpoint);
        return ListenResult::Failed;
    }
    std::strncpy(addr.sun_path, endpoint.c_str(), sizeof(addr.sun_path) - 1);

    auto dir = fs::path(endpoint).parent_path();
    if (!dir.empty() && !platform::ensure_private_dir(dir.string())) {
        return ListenResult::Failed;
    }

    // Stale socket from a crashed instance, or a live one?
    struct stat st{};
    if (::lstat(endpoint.c_str(), &st) == 0) {
        if (peer_listening(endpoint)) return ListenResult::AlreadyRunning;
        if (!S_ISSOCK(st.st_mode)) {
            std::println(stderr, "ipc: {} exists and is not a socket, refusing to replace it", endpoint);
            return ListenResult::Failed;
        }
        if (::unlink(endpoint.c_str()) < 0 && errno != ENOENT) {
            std::println(stderr, "ipc: cannot remove stale socket {}: {}", endpoint, std::strerror(errno));
            return ListenResult::Failed;
        }
    }

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        std::println(stderr, "ipc: socket() failed: {}", std::strerror(errno));
        return ListenResult::Failed;
    }

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        ::close(fd);
        // Someone bound the path after our check; they may not be
        // listening yet, but the path is theirs.
        if (err == EADDRINUSE) {
            return ListenResult::AlreadyRunning;
        }
        std::println(stderr, "ipc: bind() {} failed: {}", endpoint, std::strerror(err));
        return ListenResult::Failed;
    }

    if (::chmod(endpoint.c_str(), 0600) < 0) {
        std::println(stderr, "ipc: chmod {} failed: {}", endpoint, std::strerror(errno));
        ::close(fd);
        ::unlink(endpoint.c_str());
        return ListenResult::Failed;
    }

    if (::lstat(endpoint.c_str(), &st) == 0) socket_ino_ = st.st_ino;

    auto result = finish_start(fd, endpoint);
    if (result != ListenResult::Listening) {
        ::unlink(endpoint.c_str());
        return result;
    }
    socket_path_ = endpoint;
    return result;
}

void UnixSocketServer::release_address() {
    if (socket_path_.empty()) return;

    // Only remove the path if it is still our socket; a newer instance may
    // already have replaced it.
    struct stat st{};
    if (::lstat(socket_path_.c_str(), &st) == 0 && st.st_ino == socket_ino_) {
        ::unlink(socket_path_.c_str());
    }
    socket_path_.clear();
}
