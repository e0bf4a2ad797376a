#include "platform/launcher.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <print>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

bool spawn_detached(const std::string& program, const std::vector<std::string>& args) {
    // Exec failures are reported back through a close-on-exec pipe.
    int pipefd[2];
    if (::pipe2(pipefd, O_CLOEXEC) < 0) {
        std::println(stderr, "pipe2() failed: {}", std::strerror(errno));
        return false;
    }

    pid_t pid = fork();
    if (pid < 0) {
        std::println(stderr, "fork() failed: {}", std::strerror(errno));
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        return false;
    }

    if (pid == 0) {
        ::close(pipefd[0]);
        setsid();

        // Fork again so the app is reparented and never becomes our zombie.
        pid = fork();
        if (pid < 0) _exit(1);
        if (pid > 0) _exit(0);

        std::freopen("/dev/null", "r", stdin);
        std::freopen("/dev/null", "w", stdout);
        std::freopen("/dev/null", "w", stderr);

        std::vector<char*> argv;
        argv.push_back(const_cast<char*>(program.c_str()));
        for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
        argv.push_back(nullptr);

        ::execvp(program.c_str(), argv.data());
        int err = errno;
        ::write(pipefd[1], &err, sizeof(err));
        _exit(127);
    }

    ::close(pipefd[1]);
    int status = 0;
    ::waitpid(pid, &status, 0);

    int err = 0;
    ssize_t n = ::read(pipefd[0], &err, sizeof(err));
    ::close(pipefd[0]);
    if (n == sizeof(err)) {
        std::println(stderr, "cannot start {}: {}", program, std::strerror(err));
        return false;
    }
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

std::string sibling_executable(const std::string& name) {
    std::error_code ec;
    auto self = fs::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        auto candidate = self.parent_path() / name;
        if (::access(candidate.c_str(), X_OK) == 0) return candidate.string();
    }
    return name;
}

} // namespace platform
