#pragma once

#include "command_protocol.hpp"
#include "ui/ui_channel.hpp"

#include <string>

// Maps a decoded command to a response. Transport-agnostic: both listeners
// share one instance. Open/Show only enqueue a UI signal, so the response
// confirms receipt, not that the window has updated.
class CommandDispatcher {
public:
    explicit CommandDispatcher(UiChannel& ui, bool verbose = false);

    CommandDispatcher(const CommandDispatcher&) = delete;
    CommandDispatcher& operator=(const CommandDispatcher&) = delete;

    Response dispatch(const Command& cmd);

private:
    Response handle(const OpenCommand& cmd);
    Response handle(const PingCommand& cmd);
    Response handle(const ShowCommand& cmd);

    void log(const std::string& msg);

    UiChannel& ui_;
    bool verbose_;
};
