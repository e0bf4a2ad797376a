#include "dispatcher.hpp"

#include <print>

CommandDispatcher::CommandDispatcher(UiChannel& ui, bool verbose)
    : ui_(ui), verbose_(verbose) {}

Response CommandDispatcher::dispatch(const Command& cmd) {
    return std::visit([this](const auto& c) { return handle(c); }, cmd);
}

Response CommandDispatcher::handle(const OpenCommand& cmd) {
    if (!ui_.send(UiSignal::open(cmd.path))) {
        log("open " + cmd.path + " dropped: ui channel closed");
        return Response::failure("ui unavailable");
    }
    log("open " + cmd.path);
    return Response::success();
}

Response CommandDispatcher::handle(const PingCommand& /*cmd*/) {
    return Response::success();
}

Response CommandDispatcher::handle(const ShowCommand& /*cmd*/) {
    if (!ui_.send(UiSignal::focus())) {
        log("show dropped: ui channel closed");
        return Response::failure("ui unavailable");
    }
    return Response::success();
}

void CommandDispatcher::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[arandu] {}", msg);
    }
}
