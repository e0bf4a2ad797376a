#include "forwarder.hpp"

#include "platform/linux/tcp_socket_client.hpp"
#include "platform/linux/unix_socket_client.hpp"

#include <filesystem>
#include <format>
#include <print>

namespace fs = std::filesystem;

Forwarder::Forwarder(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose) {}

bool Forwarder::probe() const {
    if (config_.ipc.unix_socket) {
        UnixSocketClient client;
        return client.connect(config_.ipc.socket_endpoint());
    }
    if (config_.ipc.tcp) {
        TcpSocketClient client;
        return client.connect(config_.ipc.tcp_endpoint());
    }
    return false;
}

size_t Forwarder::forward(const std::vector<Command>& cmds) {
    size_t delivered = 0;
    for (const auto& cmd : cmds) {
        auto resp = request(cmd);
        if (!resp) {
            log(std::format("{} not delivered: {}", protocol::command_name(cmd), resp.error()));
            continue;
        }
        ++delivered;
        if (!resp->ok()) {
            std::println(stderr, "instance: {} rejected: {}", protocol::command_name(cmd), resp->message);
        }
    }
    return delivered;
}

std::expected<Response, std::string> Forwarder::request(const Command& cmd) {
    auto client = connect_any();
    if (!client) return std::unexpected("no running instance");

    if (!client->send(protocol::encode(cmd))) {
        return std::unexpected("send failed");
    }

    std::string line;
    if (!client->recv(line, static_cast<int>(config_.ipc.client_timeout_ms))) {
        return std::unexpected("no response (timeout or connection closed)");
    }
    return protocol::decode_response(line);
}

std::vector<Command> Forwarder::commands_for_files(const std::vector<std::string>& files) {
    std::vector<Command> cmds;
    for (const auto& f : files) {
        std::error_code ec;
        auto abs = fs::absolute(f, ec);
        cmds.push_back(OpenCommand{ec ? f : abs.lexically_normal().string()});
    }
    if (cmds.empty()) cmds.push_back(ShowCommand{});
    return cmds;
}

std::unique_ptr<IpcClient> Forwarder::connect_any() const {
    if (config_.ipc.unix_socket) {
        auto client = std::make_unique<UnixSocketClient>();
        if (client->connect(config_.ipc.socket_endpoint())) return client;
    }
    if (config_.ipc.tcp) {
        auto client = std::make_unique<TcpSocketClient>();
        if (client->connect(config_.ipc.tcp_endpoint())) return client;
    }
    return nullptr;
}

void Forwarder::log(const std::string& msg) const {
    if (verbose_) {
        std::println(stderr, "[arandu] {}", msg);
    }
}
