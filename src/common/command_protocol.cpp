#include "command_protocol.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace protocol {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

std::string frame(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

std::string_view trim_line(std::string_view line) {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r' ||
                             line.back() == ' ' || line.back() == '\t')) {
        line.remove_suffix(1);
    }
    while (!line.empty() && (line.front() == ' ' || line.front() == '\t')) {
        line.remove_prefix(1);
    }
    return line;
}

std::expected<json, std::string> parse_object(std::string_view line) {
    line = trim_line(line);
    if (line.empty()) {
        return std::unexpected("invalid request: empty frame");
    }

    json j;
    try {
        j = json::parse(line);
    } catch (const json::exception& e) {
        return std::unexpected(std::string("invalid request: ") + e.what());
    }

    if (!j.is_object()) {
        return std::unexpected("invalid request: expected a JSON object");
    }
    return j;
}

} // namespace

std::string encode(const Command& cmd) {
    return std::visit(overloaded{
        [](const OpenCommand& c) { return frame({{"cmd", "open"}, {"path", c.path}}); },
        [](const PingCommand&) { return frame({{"cmd", "ping"}}); },
        [](const ShowCommand&) { return frame({{"cmd", "show"}}); },
    }, cmd);
}

std::string encode(const Response& resp) {
    if (resp.ok()) return frame({{"status", "ok"}});
    return frame({{"status", "error"}, {"message", resp.message}});
}

std::expected<Command, std::string> decode_command(std::string_view line) {
    auto parsed = parse_object(line);
    if (!parsed) return std::unexpected(parsed.error());
    const auto& j = *parsed;

    auto it = j.find("cmd");
    if (it == j.end() || !it->is_string()) {
        return std::unexpected("invalid request: missing string field 'cmd'");
    }
    auto tag = it->get<std::string>();

    if (tag == "open") {
        auto path = j.find("path");
        if (path == j.end() || !path->is_string()) {
            return std::unexpected("invalid request: 'open' requires a string field 'path'");
        }
        return OpenCommand{path->get<std::string>()};
    }
    if (tag == "ping") return PingCommand{};
    if (tag == "show") return ShowCommand{};

    return std::unexpected("unknown command: " + tag);
}

std::expected<Response, std::string> decode_response(std::string_view line) {
    auto parsed = parse_object(line);
    if (!parsed) return std::unexpected(parsed.error());
    const auto& j = *parsed;

    auto status = j.find("status");
    if (status == j.end() || !status->is_string()) {
        return std::unexpected("invalid response: missing string field 'status'");
    }

    if (*status == "ok") return Response::success();
    if (*status == "error") {
        std::string message;
        auto m = j.find("message");
        if (m != j.end() && m->is_string()) message = m->get<std::string>();
        return Response::failure(std::move(message));
    }
    return std::unexpected("invalid response: unknown status " + status->dump());
}

std::string_view command_name(const Command& cmd) {
    return std::visit(overloaded{
        [](const OpenCommand&) { return std::string_view("open"); },
        [](const PingCommand&) { return std::string_view("ping"); },
        [](const ShowCommand&) { return std::string_view("show"); },
    }, cmd);
}

} // namespace protocol
