#include "instance_guard.hpp"

#include "forwarder.hpp"
#include "platform/linux/tcp_socket_server.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <chrono>
#include <print>
#include <thread>

InstanceGuard::InstanceGuard(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose) {}

InstanceGuard::~InstanceGuard() = default;

InstanceRole InstanceGuard::resolve() {
    Forwarder forwarder(config_, verbose_);
    if (forwarder.probe()) {
        log("instance already running");
        return InstanceRole::ClientAndExit;
    }

    switch (lock_.acquire(config_.ipc.lock_path())) {
        case LockResult::Acquired:
            break;
        case LockResult::Held:
            log("another instance is starting up");
            lost_race_ = true;
            return InstanceRole::ClientAndExit;
        case LockResult::Unavailable:
            log("instance lock unavailable, socket bind decides");
            break;
    }

    if (!bind_listeners()) {
        lost_race_ = true;
        lock_.release();
        return InstanceRole::ClientAndExit;
    }
    return InstanceRole::Server;
}

std::vector<std::unique_ptr<IpcServer>> InstanceGuard::take_listeners() {
    return std::move(listeners_);
}

int InstanceGuard::forward(const std::vector<std::string>& files) {
    Forwarder forwarder(config_, verbose_);
    auto cmds = Forwarder::commands_for_files(files);

    size_t delivered = forwarder.forward(cmds);
    if (delivered == 0 && lost_race_) {
        // The winner may still be binding; one more try.
        std::this_thread::sleep_for(std::chrono::milliseconds(config_.instance.forward_retry_delay_ms));
        delivered = forwarder.forward(cmds);
    }

    if (delivered < cmds.size()) {
        std::println(stderr, "instance: forwarded {}/{} request(s) to the running instance",
                     delivered, cmds.size());
    } else {
        log("forwarded to running instance");
    }
    return 0;
}

// Returns false only when a live peer won the socket; transport failures just
// leave that transport out.
bool InstanceGuard::bind_listeners() {
    if (config_.ipc.unix_socket) {
        auto server = std::make_unique<UnixSocketServer>(config_.ipc.max_frame_bytes);
        auto path = config_.ipc.socket_endpoint();
        switch (server->start(path)) {
            case ListenResult::Listening:
                listeners_.push_back(std::move(server));
                break;
            case ListenResult::AlreadyRunning:
                log("lost the socket to another instance at " + path);
                listeners_.clear();
                return false;
            case ListenResult::Failed:
                std::println(stderr, "instance: local socket unavailable, continuing without it");
                break;
        }
    }

    if (config_.ipc.tcp) {
        auto server = std::make_unique<TcpSocketServer>(config_.ipc.max_frame_bytes);
        if (server->start(config_.ipc.tcp_endpoint()) == ListenResult::Listening) {
            listeners_.push_back(std::move(server));
        } else {
            std::println(stderr, "instance: loopback port {} unavailable, continuing without it",
                         config_.ipc.tcp_port);
        }
    }

    return true;
}

void InstanceGuard::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[arandu] {}", msg);
    }
}
