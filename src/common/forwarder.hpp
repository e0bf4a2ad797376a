#pragma once

#include "command_protocol.hpp"
#include "config.hpp"
#include "platform/ipc_client.hpp"

#include <cstddef>
#include <expected>
#include <memory>
#include <string>
#include <vector>

// Client side of the instance protocol: one connection per command, the
// Unix socket first, then the loopback port.
class Forwarder {
public:
    explicit Forwarder(Config config, bool verbose = false);

    // Probe-connect on the local socket; the loopback port is only probed
    // when the local socket is disabled. A foreign process holding the fixed
    // port must not make this look like a running instance.
    bool probe() const;

    // Returns how many commands reached a running instance. Failure responses
    // count as delivered; they are logged and otherwise ignored.
    size_t forward(const std::vector<Command>& cmds);

    // Single round trip over whichever transport connects first.
    std::expected<Response, std::string> request(const Command& cmd);

    // Open for every file (made absolute), or a single Show when empty.
    static std::vector<Command> commands_for_files(const std::vector<std::string>& files);

private:
    std::unique_ptr<IpcClient> connect_any() const;
    void log(const std::string& msg) const;

    Config config_;
    bool verbose_;
};
