#pragma once

#include "app_core.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "platform/linux/ipc_event_loop.hpp"
#include "ui/ui_channel.hpp"
#include "ui/ui_layer.hpp"

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

// Server-role main loop. The UI side runs here (signalfd + channel eventfd);
// the listeners run on their own thread so neither side can stall the other.
class LinuxEventLoop {
public:
    LinuxEventLoop(Config config, bool verbose,
                   std::vector<std::unique_ptr<IpcServer>> listeners, UiLayer& ui);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run(const std::vector<std::string>& startup_files);
    void request_stop();

    AppCore& core() { return core_; }

private:
    void shutdown();
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    UiChannel channel_;
    CommandDispatcher dispatcher_;
    AppCore core_;
    IpcEventLoop ipc_loop_;
    std::jthread ipc_thread_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int stop_fd_ = -1;

    std::atomic<bool> running_{false};
};
