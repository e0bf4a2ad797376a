#pragma once

#include <string>
#include <string_view>

class IpcClient {
public:
    virtual ~IpcClient() = default;
    virtual bool connect(const std::string& endpoint) = 0;
    // frame must already carry its trailing newline.
    virtual bool send(std::string_view frame) = 0;
    // Reads one newline-terminated line (newline stripped).
    virtual bool recv(std::string& line, int timeout_ms = 2000) = 0;
    virtual void close() = 0;
};
