#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <variant>

// Requests accepted by a running instance.
struct OpenCommand {
    std::string path;
};

struct PingCommand {};

struct ShowCommand {};

using Command = std::variant<OpenCommand, PingCommand, ShowCommand>;

enum class ResponseStatus { Success, Failure };

struct Response {
    ResponseStatus status = ResponseStatus::Success;
    std::string message;

    static Response success() { return {}; }
    static Response failure(std::string message) {
        return {ResponseStatus::Failure, std::move(message)};
    }

    bool ok() const { return status == ResponseStatus::Success; }
};

// Wire format: one JSON object per frame, terminated by '\n'.
//   {"cmd":"open","path":"..."}  {"cmd":"ping"}  {"cmd":"show"}
//   {"status":"ok"}              {"status":"error","message":"..."}
namespace protocol {

// Encoded frames include the trailing newline. Encoding never fails; invalid
// UTF-8 in a path is replaced rather than rejected.
std::string encode(const Command& cmd);
std::string encode(const Response& resp);

// Decode one line (with or without its trailing newline). The error string is
// meant to be sent back verbatim as a Failure message.
std::expected<Command, std::string> decode_command(std::string_view line);
std::expected<Response, std::string> decode_response(std::string_view line);

std::string_view command_name(const Command& cmd);

} // namespace protocol
