#pragma once

#include "config.hpp"
#include "platform/ipc_server.hpp"
#include "platform/linux/singleton_lock.hpp"

#include <memory>
#include <string>
#include <vector>

enum class InstanceRole { Server, ClientAndExit };

// Decides at startup whether this process serves or forwards.
//
// Order: probe-connect the running instance; take the singleton lock (the
// atomic arbiter between processes starting together); bind the Unix socket,
// then the loopback port. Losing at the lock or at the socket bind means
// another process is becoming the server, so this one forwards instead.
class InstanceGuard {
public:
    explicit InstanceGuard(Config config, bool verbose = false);
    ~InstanceGuard();

    InstanceGuard(const InstanceGuard&) = delete;
    InstanceGuard& operator=(const InstanceGuard&) = delete;

    InstanceRole resolve();

    // Server role: the bound listeners. May be empty when both transports
    // failed; the app then runs without fast IPC.
    std::vector<std::unique_ptr<IpcServer>> take_listeners();

    // Client role: send Open per file (Show if none) and report the exit
    // status, which is 0 whether or not the forward got through.
    int forward(const std::vector<std::string>& files);

    bool lost_race() const { return lost_race_; }

private:
    bool bind_listeners();
    void log(const std::string& msg);

    Config config_;
    bool verbose_;
    SingletonLock lock_;
    std::vector<std::unique_ptr<IpcServer>> listeners_;
    bool lost_race_ = false;
};
