#include "platform/linux/singleton_lock.hpp"

#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <print>
#include <string>
#include <sys/file.h>
#include <unistd.h>

SingletonLock::SingletonLock() = default;

SingletonLock::~SingletonLock() {
    release();
}

LockResult SingletonLock::acquire(const std::string& path) {
    release();

    auto dir = std::filesystem::path(path).parent_path();
    if (!dir.empty() && !platform::ensure_private_dir(dir.string())) {
        return LockResult::Unavailable;
    }

    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd < 0) {
        std::println(stderr, "instance: cannot open lock {}: {}", path, std::strerror(errno));
        return LockResult::Unavailable;
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) < 0) {
        int err = errno;
        ::close(fd);
        if (err == EWOULDBLOCK) return LockResult::Held;
        std::println(stderr, "instance: flock {} failed: {}", path, std::strerror(err));
        return LockResult::Unavailable;
    }

    // Owner pid, for humans only.
    auto pid = std::to_string(::getpid()) + "\n";
    if (::ftruncate(fd, 0) == 0) {
        if (::write(fd, pid.data(), pid.size()) < 0) {
            std::println(stderr, "instance: cannot write pid to {}: {}", path, std::strerror(errno));
        }
    }

    fd_ = fd;
    return LockResult::Acquired;
}

void SingletonLock::release() {
    // The file stays. Unlinking it would let a newcomer lock a fresh inode
    // while another process still holds the old one.
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}
