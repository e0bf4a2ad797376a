#include <catch2/catch_test_macros.hpp>

#include "command_protocol.hpp"
#include "platform/linux/tcp_socket_client.hpp"
#include "platform/linux/tcp_socket_server.hpp"
#include "platform/linux/unix_socket_client.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>

namespace {

// RAII temp directory that auto-deletes.
struct TmpDir {
    std::string path;

    TmpDir() {
        std::string tmpl = "/tmp/arandu_test_XXXXXX";
        path = ::mkdtemp(tmpl.data());
    }

    ~TmpDir() { std::filesystem::remove_all(path); }
};

// Leave a bound-but-dead socket file behind, as a crashed process would.
void make_stale_socket(const std::string& path) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    ::close(fd);
}

ReadResult read_with_retry(IpcServer& server, int fd, std::string& line) {
    ReadResult r = ReadResult::Pending;
    for (int i = 0; i < 200 && r == ReadResult::Pending; ++i) {
        r = server.read_frame(fd, line);
        if (r == ReadResult::Pending) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return r;
}

int accept_with_retry(IpcServer& server) {
    int fd = -1;
    for (int i = 0; i < 200 && fd < 0; ++i) {
        fd = server.accept_client();
        if (fd < 0) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return fd;
}

} // namespace

TEST_CASE("Unix socket listener", "[ipc][unix]") {
    TmpDir dir;
    auto sock_path = dir.path + "/arandu.sock";

    SECTION("StartStopRemovesPath") {
        UnixSocketServer server(4096);
        REQUIRE(server.start(sock_path) == ListenResult::Listening);
        REQUIRE(std::filesystem::exists(sock_path));
        server.stop();
        REQUIRE_FALSE(std::filesystem::exists(sock_path));
    }

    SECTION("DestructorRemovesPath") {
        {
            UnixSocketServer server(4096);
            REQUIRE(server.start(sock_path) == ListenResult::Listening);
        }
        REQUIRE_FALSE(std::filesystem::exists(sock_path));
    }

    SECTION("OwnerOnlyPermissions") {
        UnixSocketServer server(4096);
        REQUIRE(server.start(sock_path) == ListenResult::Listening);

        struct stat st{};
        REQUIRE(::stat(sock_path.c_str(), &st) == 0);
        REQUIRE(S_ISSOCK(st.st_mode));
        REQUIRE((st.st_mode & 0777) == 0600);
    }

    SECTION("CreatesMissingRuntimeDir") {
        auto nested = dir.path + "/run/arandu.sock";
        UnixSocketServer server(4096);
        REQUIRE(server.start(nested) == ListenResult::Listening);

        struct stat st{};
        REQUIRE(::stat((dir.path + "/run").c_str(), &st) == 0);
        REQUIRE((st.st_mode & 0777) == 0700);
    }

    SECTION("StaleSocketIsReplaced") {
        make_stale_socket(sock_path);
        REQUIRE(std::filesystem::exists(sock_path));

        UnixSocketServer server(4096);
        REQUIRE(server.start(sock_path) == ListenResult::Listening);

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
    }

    SECTION("LiveSocketIsNotStolen") {
        UnixSocketServer first(4096);
        REQUIRE(first.start(sock_path) == ListenResult::Listening);

        UnixSocketServer second(4096);
        REQUIRE(second.start(sock_path) == ListenResult::AlreadyRunning);
        second.stop();

        // The loser must not have unlinked the winner's socket.
        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
    }

    SECTION("RefusesToReplaceRegularFile") {
        std::ofstream(sock_path) << "not a socket";
        UnixSocketServer server(4096);
        REQUIRE(server.start(sock_path) == ListenResult::Failed);
        REQUIRE(std::filesystem::is_regular_file(sock_path));
    }

    SECTION("UnwritableDirectoryFails") {
        if (::geteuid() == 0) SKIP("root ignores directory permissions");
        auto ro = dir.path + "/ro";
        std::filesystem::create_directory(ro);
        ::chmod(ro.c_str(), 0500);

        UnixSocketServer server(4096);
        REQUIRE(server.start(ro + "/arandu.sock") == ListenResult::Failed);
        ::chmod(ro.c_str(), 0700);
    }

    SECTION("PathTooLongFails") {
        UnixSocketServer server(4096);
        REQUIRE(server.start(dir.path + "/" + std::string(200, 'a') + ".sock") == ListenResult::Failed);
    }

    SECTION("StopListeningKeepsAcceptedClients") {
        UnixSocketServer server(4096);
        REQUIRE(server.start(sock_path) == ListenResult::Listening);

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int fd = accept_with_retry(server);
        REQUIRE(fd >= 0);

        server.stop_listening();
        REQUIRE_FALSE(std::filesystem::exists(sock_path));

        REQUIRE(client.send(protocol::encode(Command{PingCommand{}})));
        std::string line;
        REQUIRE(read_with_retry(server, fd, line) == ReadResult::Frame);
        REQUIRE(server.send_frame(fd, protocol::encode(Response::success())));

        std::string reply;
        REQUIRE(client.recv(reply, 1000));
        REQUIRE(reply == R"({"status":"ok"})");
        server.close_client(fd);
    }

    SECTION("DoesNotUnlinkReplacedSocket") {
        UnixSocketServer old_server(4096);
        REQUIRE(old_server.start(sock_path) == ListenResult::Listening);

        // Someone else took over the path.
        std::filesystem::remove(sock_path);
        UnixSocketServer new_server(4096);
        REQUIRE(new_server.start(sock_path) == ListenResult::Listening);

        old_server.stop();
        REQUIRE(std::filesystem::exists(sock_path));
    }
}

TEST_CASE("Frame reading", "[ipc][framing]") {
    TmpDir dir;
    auto sock_path = dir.path + "/arandu.sock";

    UnixSocketServer server(64);
    REQUIRE(server.start(sock_path) == ListenResult::Listening);

    UnixSocketClient client;
    REQUIRE(client.connect(sock_path));
    int fd = accept_with_retry(server);
    REQUIRE(fd >= 0);

    SECTION("PendingUntilNewline") {
        REQUIRE(client.send(R"({"cmd":)"));
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

        std::string line;
        REQUIRE(server.read_frame(fd, line) == ReadResult::Pending);

        REQUIRE(client.send("\"ping\"}\n"));
        REQUIRE(read_with_retry(server, fd, line) == ReadResult::Frame);
        REQUIRE(line == R"({"cmd":"ping"})");
    }

    SECTION("UnterminatedTailBeforeEof") {
        REQUIRE(client.send(R"({"cmd":"op)"));
        client.close();

        std::string line;
        REQUIRE(read_with_retry(server, fd, line) == ReadResult::Frame);
        REQUIRE(line == R"({"cmd":"op)");
        REQUIRE(read_with_retry(server, fd, line) == ReadResult::Closed);
    }

    SECTION("DisconnectWithoutData") {
        client.close();

        std::string line;
        REQUIRE(read_with_retry(server, fd, line) == ReadResult::Closed);
    }

    SECTION("OversizedFrame") {
        REQUIRE(client.send(std::string(200, 'x')));

        std::string line;
        REQUIRE(read_with_retry(server, fd, line) == ReadResult::Overflow);
    }

    server.close_client(fd);
}

TEST_CASE("Loopback TCP listener", "[ipc][tcp]") {

    SECTION("BindsEphemeralPortOnLoopback") {
        TcpSocketServer server(4096);
        REQUIRE(server.start("127.0.0.1:0") == ListenResult::Listening);
        REQUIRE(server.bound_port() != 0);
        REQUIRE(server.endpoint() == "127.0.0.1:" + std::to_string(server.bound_port()));

        TcpSocketClient client;
        REQUIRE(client.connect(server.endpoint()));
    }

    SECTION("RefusesNonLoopbackAddresses") {
        TcpSocketServer wildcard(4096);
        REQUIRE(wildcard.start("0.0.0.0:0") == ListenResult::Failed);

        TcpSocketServer routable(4096);
        REQUIRE(routable.start("192.168.1.10:0") == ListenResult::Failed);
    }

    SECTION("PortCollisionIsNonFatal") {
        TcpSocketServer first(4096);
        REQUIRE(first.start("127.0.0.1:0") == ListenResult::Listening);

        TcpSocketServer second(4096);
        REQUIRE(second.start(first.endpoint()) == ListenResult::Failed);
        REQUIRE(second.server_fd() < 0);
    }

    SECTION("RoundTrip") {
        TcpSocketServer server(4096);
        REQUIRE(server.start("127.0.0.1:0") == ListenResult::Listening);

        TcpSocketClient client;
        REQUIRE(client.connect(server.endpoint()));
        int fd = accept_with_retry(server);
        REQUIRE(fd >= 0);

        REQUIRE(client.send(protocol::encode(Command{ShowCommand{}})));
        std::string line;
        REQUIRE(read_with_retry(server, fd, line) == ReadResult::Frame);
        REQUIRE(line == R"({"cmd":"show"})");

        REQUIRE(server.send_frame(fd, protocol::encode(Response::failure("x"))));
        std::string reply;
        REQUIRE(client.recv(reply, 1000));
        auto resp = protocol::decode_response(reply);
        REQUIRE(resp.has_value());
        REQUIRE_FALSE(resp->ok());

        server.close_client(fd);
    }

    SECTION("BadEndpoint") {
        TcpSocketServer server(4096);
        REQUIRE(server.start("localhost") == ListenResult::Failed);
        REQUIRE(server.start("127.0.0.1:99999") == ListenResult::Failed);
    }
}
