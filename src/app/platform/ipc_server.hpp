#pragma once

#include <string>
#include <string_view>

enum class ListenResult {
    Listening,
    AlreadyRunning,  // a live peer answered on the endpoint
    Failed,          // transport unavailable; the app keeps running without it
};

enum class ReadResult {
    Frame,     // one complete line, or the unterminated tail before EOF
    Pending,   // need more data
    Closed,    // peer went away (or errored) before finishing a frame
    Overflow,  // frame exceeded the size limit without a newline
};

class IpcServer {
public:
    virtual ~IpcServer() = default;
    virtual ListenResult start(const std::string& endpoint) = 0;
    // Stop accepting: close the listening socket and release its address.
    // Accepted clients stay open.
    virtual void stop_listening() = 0;
    // stop_listening() plus close every client.
    virtual void stop() = 0;
    virtual int server_fd() const = 0;
    virtual const std::string& endpoint() const = 0;
    // Returns client fd or -1 when no connection is pending.
    virtual int accept_client() = 0;
    virtual ReadResult read_frame(int client_fd, std::string& line) = 0;
    virtual bool send_frame(int client_fd, std::string_view frame) = 0;
    virtual void close_client(int client_fd) = 0;
};
