#include "platform/linux/linux_event_loop.hpp"

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose,
                               std::vector<std::unique_ptr<IpcServer>> listeners, UiLayer& ui)
    : config_(std::move(config)), verbose_(verbose),
      dispatcher_(channel_, verbose_),
      core_(config_, verbose_, channel_, ui),
      ipc_loop_(std::move(listeners), dispatcher_,
                std::chrono::milliseconds(config_.ipc.shutdown_grace_ms), verbose_) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (ipc_thread_.joinable()) {
        ipc_loop_.request_stop();
        ipc_thread_.join();
    }
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (stop_fd_ >= 0) ::close(stop_fd_);
}

bool LinuxEventLoop::init() {
    if (!channel_.init()) return false;
    if (!core_.init()) return false;

    // Block before the IPC thread exists so it inherits the mask and the
    // signals only ever surface through signalfd here.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigaddset(&mask, SIGHUP);
    pthread_sigmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    stop_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (stop_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd) {
        epoll_event ev{.events = EPOLLIN, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_) || !add_fd(stop_fd_) || !add_fd(channel_.event_fd())) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }

    if (ipc_loop_.listener_count() == 0) {
        std::println(stderr, "Warning: no IPC transport available, running standalone");
    }
    if (!ipc_loop_.init()) return false;

    ipc_thread_ = std::jthread([this] { ipc_loop_.run(); });

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run(const std::vector<std::string>& startup_files) {
    core_.open_startup_files(startup_files);
    core_.pump();

    constexpr int MAX_EVENTS = 8;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_acquire)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                ::read(signal_fd_, &info, sizeof(info));
                log("Received signal, shutting down");
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == stop_fd_) {
                uint64_t val;
                ::read(stop_fd_, &val, sizeof(val));
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == channel_.event_fd()) {
                core_.pump();
            }
        }
    }

    shutdown();
}

void LinuxEventLoop::request_stop() {
    uint64_t val = 1;
    if (stop_fd_ >= 0) ::write(stop_fd_, &val, sizeof(val));
}

void LinuxEventLoop::shutdown() {
    // Listeners first: socket path removed, in-flight requests get the grace
    // period and still reach the channel before it closes.
    if (ipc_thread_.joinable()) {
        ipc_loop_.request_stop();
        ipc_thread_.join();
    }
    core_.shutdown();
    log("stopped");
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[arandu] {}", msg);
    }
}
