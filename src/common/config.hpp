#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

struct Config {
    struct Ipc {
        std::string socket_path;  // empty: platform default
        bool unix_socket = true;
        bool tcp = true;
        uint16_t tcp_port = 7474;
        size_t max_frame_bytes = 1024 * 1024;
        uint32_t shutdown_grace_ms = 500;
        uint32_t client_timeout_ms = 2000;

        // Resolved endpoints (no independent config keys).
        std::string socket_endpoint() const;
        std::string lock_path() const;
        std::string tcp_endpoint() const;
    } ipc;

    struct Instance {
        uint32_t forward_retry_delay_ms = 250;
    } instance;

    struct History {
        bool enabled = true;
        uint32_t max_entries = 20;
    } history;

    static Config load(const std::string& path);
    static Config load_default();
};
