#include "app_core.hpp"
#include "config.hpp"
#include "instance_guard.hpp"
#include "platform/linux/linux_event_loop.hpp"
#include "storage/history_db.hpp"
#include "ui/console_ui.hpp"

#include <cstdlib>
#include <print>
#include <string>
#include <vector>

static void usage() {
    std::println("Usage: arandu [options] [FILE...]");
    std::println("Options:");
    std::println("  -v, --verbose       Enable verbose logging");
    std::println("  -c, --config PATH   Config file path");
    std::println("      --recent [N]    List recently opened files and exit");
    std::println("  -h, --help          Show this help");
}

static int print_recent(const Config& config, int limit) {
    HistoryDb db;
    if (!db.open(AppCore::history_path(), config.history.max_entries)) {
        std::println(stderr, "No history available");
        return 1;
    }
    for (const auto& e : db.recent(limit)) {
        std::println("{:>4}  {}", e.open_count, e.path);
    }
    return 0;
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    std::string config_path;
    int recent_limit = -1;
    std::vector<std::string> files;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--recent") {
            recent_limit = 10;
            if (i + 1 < argc && std::atoi(argv[i + 1]) > 0) recent_limit = std::atoi(argv[++i]);
        } else if (arg == "--help" || arg == "-h") {
            usage();
            return 0;
        } else if (arg == "--") {
            for (++i; i < argc; i++) files.emplace_back(argv[i]);
        } else {
            files.push_back(std::move(arg));
        }
    }

    Config config;
    if (!config_path.empty()) {
        config = Config::load(config_path);
    } else {
        config = Config::load_default();
    }

    if (recent_limit > 0) {
        return print_recent(config, recent_limit);
    }

    InstanceGuard guard(config, verbose);
    if (guard.resolve() == InstanceRole::ClientAndExit) {
        return guard.forward(files);
    }

    if (verbose) {
        std::println(stderr, "[arandu] Starting as primary instance (socket: {})",
                     config.ipc.socket_endpoint());
    }

    ConsoleUi ui;
    LinuxEventLoop loop(std::move(config), verbose, guard.take_listeners(), ui);
    if (!loop.init()) {
        std::println(stderr, "Failed to initialize event loop");
        return 1;
    }

    loop.run(files);
    return 0;
}
