#include <catch2/catch_test_macros.hpp>

#include "forwarder.hpp"
#include "platform/linux/linux_event_loop.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <signal.h>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

struct TmpDir {
    std::string path;

    TmpDir() {
        std::string tmpl = "/tmp/arandu_test_XXXXXX";
        path = ::mkdtemp(tmpl.data());
    }

    ~TmpDir() { fs::remove_all(path); }
};

// Only touched from the loop thread until that thread is joined.
struct RecordingUi : UiLayer {
    std::vector<std::string> calls;

    void open(const std::string& path) override { calls.push_back("open " + path); }
    void focus() override { calls.push_back("focus"); }

    bool saw(const std::string& call) const {
        return std::ranges::find(calls, call) != calls.end();
    }
};

// Declared after the runner thread so a failed REQUIRE still stops the loop
// before the thread is joined.
struct StopOnExit {
    LinuxEventLoop& loop;
    ~StopOnExit() { loop.request_stop(); }
};

Config test_config(const std::string& dir) {
    Config config;
    config.ipc.socket_path = dir + "/arandu.sock";
    config.ipc.tcp = false;
    config.ipc.shutdown_grace_ms = 200;
    config.history.enabled = false;
    return config;
}

std::vector<std::unique_ptr<IpcServer>> unix_listener(const Config& config) {
    auto server = std::make_unique<UnixSocketServer>(config.ipc.max_frame_bytes);
    REQUIRE(server->start(config.ipc.socket_endpoint()) == ListenResult::Listening);
    std::vector<std::unique_ptr<IpcServer>> listeners;
    listeners.push_back(std::move(server));
    return listeners;
}

} // namespace

TEST_CASE("Server main loop", "[app][loop]") {
    TmpDir dir;
    auto config = test_config(dir.path);
    auto sock_path = config.ipc.socket_endpoint();
    RecordingUi ui;

    LinuxEventLoop loop(config, false, unix_listener(config), ui);
    REQUIRE(loop.init());

    SECTION("StartupAndForwardedOpensReachUi") {
        std::jthread runner([&] { loop.run({"a.md"}); });
        StopOnExit stop{loop};

        Forwarder forwarder(config);
        auto resp = forwarder.request(Command{OpenCommand{"/b.md"}});
        REQUIRE(resp.has_value());
        REQUIRE(resp->ok());

        loop.request_stop();
        runner.join();

        auto a_path = (fs::current_path() / "a.md").lexically_normal().string();
        // The forwarded request may beat the startup file onto the channel.
        REQUIRE(ui.calls.size() == 2);
        REQUIRE(ui.saw("open " + a_path));
        REQUIRE(ui.saw("open /b.md"));
        REQUIRE_FALSE(fs::exists(sock_path));
        REQUIRE_FALSE(forwarder.probe());
    }

    SECTION("ShowRaisesWindow") {
        std::jthread runner([&] { loop.run({}); });
        StopOnExit stop{loop};

        Forwarder forwarder(config);
        REQUIRE(forwarder.forward({Command{ShowCommand{}}}) == 1);

        loop.request_stop();
        runner.join();

        REQUIRE(ui.calls == std::vector<std::string>{"focus"});
    }

    SECTION("TerminationSignalShutsDown") {
        std::jthread runner([&] { loop.run({}); });
        StopOnExit stop{loop};

        Forwarder forwarder(config);
        REQUIRE(forwarder.request(Command{PingCommand{}}).has_value());

        // init() blocked SIGTERM in every thread, so it lands in the signalfd.
        REQUIRE(::kill(::getpid(), SIGTERM) == 0);
        runner.join();

        REQUIRE(ui.calls.empty());
        REQUIRE_FALSE(fs::exists(sock_path));
    }
}
