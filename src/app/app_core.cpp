#include "app_core.hpp"

#include "forwarder.hpp"
#include "platform/platform_paths.hpp"

#include <format>
#include <print>
#include <unistd.h>
#include <variant>

AppCore::AppCore(Config config, bool verbose, UiChannel& channel, UiLayer& ui)
    : config_(std::move(config)), verbose_(verbose), channel_(channel), ui_(ui) {}

AppCore::~AppCore() = default;

bool AppCore::init() {
    return init(history_path());
}

bool AppCore::init(const std::string& db_path) {
    if (!config_.history.enabled) return true;
    if (config_.history.max_entries == 0) {
        log("history.max_entries is 0, recent files disabled");
        return true;
    }

    if (!history_db_.open(db_path, config_.history.max_entries)) {
        std::println(stderr, "Warning: history DB failed to open, recent files disabled");
    }
    return true;
}

void AppCore::open_startup_files(const std::vector<std::string>& files) {
    if (files.empty()) return;

    // Same path normalization as a forwarded request.
    for (const auto& cmd : Forwarder::commands_for_files(files)) {
        if (auto* open = std::get_if<OpenCommand>(&cmd)) {
            if (!channel_.send(UiSignal::open(open->path))) {
                std::println(stderr, "Warning: ui channel closed, not opening {}", open->path);
            }
        }
    }
}

std::string AppCore::history_path() {
    auto data = platform::data_dir();
    if (!data.empty()) return data + "/history.db";
    // Same per-user fallback as the runtime dir.
    return std::format("/tmp/arandu-{}/history.db", ::getuid());
}

size_t AppCore::pump() {
    auto signals = channel_.drain();
    for (const auto& s : signals) {
        apply(s);
    }
    return signals.size();
}

std::vector<RecentFile> AppCore::recent(int limit) {
    return history_db_.recent(limit);
}

void AppCore::shutdown() {
    channel_.close();
    // Anything that slipped in before close still gets applied.
    pump();
    history_db_.close();
}

void AppCore::apply(const UiSignal& signal) {
    switch (signal.kind) {
        case UiSignalKind::Open:
            log("opening " + signal.path);
            ui_.open(signal.path);
            if (history_db_.is_open()) {
                history_db_.record(signal.path);
            }
            break;
        case UiSignalKind::Focus:
            ui_.focus();
            break;
    }
}

void AppCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[arandu] {}", msg);
    }
}
