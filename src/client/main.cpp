#include "config.hpp"
#include "forwarder.hpp"
#include "platform/launcher.hpp"

#include <print>
#include <string>
#include <vector>

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [options] [FILE...]", prog);
    std::println(stderr, "Opens FILEs in the running arandu instance, starting one if needed.");
    std::println(stderr, "Options:");
    std::println(stderr, "  -v, --verbose       Enable verbose logging");
    std::println(stderr, "  -c, --config PATH   Config file path");
    std::println(stderr, "      --ping          Only check whether an instance is running");
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    bool ping_only = false;
    std::string config_path;
    std::vector<std::string> files;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--ping") {
            ping_only = true;
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            files.push_back(std::move(arg));
        }
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    Forwarder forwarder(config, verbose);

    if (ping_only) {
        auto resp = forwarder.request(PingCommand{});
        if (!resp) {
            std::println(stderr, "arandu is not running");
            return 1;
        }
        std::println("{}", resp->ok() ? "OK" : resp->message);
        return resp->ok() ? 0 : 1;
    }

    auto cmds = Forwarder::commands_for_files(files);
    if (forwarder.forward(cmds) > 0) {
        return 0;
    }

    // Nobody answered on either transport: start a fresh instance, which
    // becomes the server itself.
    std::vector<std::string> args;
    if (verbose) args.emplace_back("--verbose");
    if (!config_path.empty()) {
        args.emplace_back("--config");
        args.push_back(config_path);
    }
    args.emplace_back("--");
    for (const auto& cmd : cmds) {
        if (auto* open = std::get_if<OpenCommand>(&cmd)) args.push_back(open->path);
    }

    auto program = platform::sibling_executable("arandu");
    if (!platform::spawn_detached(program, args)) {
        return 1;
    }
    return 0;
}
