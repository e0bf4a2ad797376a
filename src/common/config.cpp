#include "config.hpp"

#include "platform/platform_paths.hpp"
#include "platform/tcp_endpoint.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::string Config::Ipc::socket_endpoint() const {
    if (!socket_path.empty()) return socket_path;
    return platform::ipc_endpoint();
}

std::string Config::Ipc::lock_path() const {
    return fs::path(socket_endpoint()).replace_extension(".lock").string();
}

std::string Config::Ipc::tcp_endpoint() const {
    return format_tcp_endpoint({.host = "127.0.0.1", .port = tcp_port});
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("ipc")) {
            auto& i = j["ipc"];
            if (i.contains("socket_path")) cfg.ipc.socket_path = i["socket_path"].get<std::string>();
            if (i.contains("unix_socket")) cfg.ipc.unix_socket = i["unix_socket"].get<bool>();
            if (i.contains("tcp")) cfg.ipc.tcp = i["tcp"].get<bool>();
            if (i.contains("tcp_port")) {
                auto port = i["tcp_port"].get<int64_t>();
                if (port >= 1 && port <= 65535) {
                    cfg.ipc.tcp_port = static_cast<uint16_t>(port);
                } else {
                    std::println(stderr, "config: ipc.tcp_port {} out of range, using {}", port, cfg.ipc.tcp_port);
                }
            }
            if (i.contains("max_frame_bytes")) cfg.ipc.max_frame_bytes = i["max_frame_bytes"].get<size_t>();
            if (i.contains("shutdown_grace_ms")) cfg.ipc.shutdown_grace_ms = i["shutdown_grace_ms"].get<uint32_t>();
            if (i.contains("client_timeout_ms")) cfg.ipc.client_timeout_ms = i["client_timeout_ms"].get<uint32_t>();
        }

        if (j.contains("instance")) {
            auto& s = j["instance"];
            if (s.contains("forward_retry_delay_ms")) {
                cfg.instance.forward_retry_delay_ms = s["forward_retry_delay_ms"].get<uint32_t>();
            }
        }

        if (j.contains("history")) {
            auto& h = j["history"];
            if (h.contains("enabled")) cfg.history.enabled = h["enabled"].get<bool>();
            if (h.contains("max_entries")) cfg.history.max_entries = h["max_entries"].get<uint32_t>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
