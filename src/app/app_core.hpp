#pragma once

#include "config.hpp"
#include "storage/history_db.hpp"
#include "ui/ui_channel.hpp"
#include "ui/ui_layer.hpp"

#include <string>
#include <vector>

// UI-side half of the application: applies signals coming off the channel to
// the window layer and keeps the recent-files list.
class AppCore {
public:
    AppCore(Config config, bool verbose, UiChannel& channel, UiLayer& ui);
    ~AppCore();

    AppCore(const AppCore&) = delete;
    AppCore& operator=(const AppCore&) = delete;

    // Opens the history store; failure only disables history.
    bool init();
    bool init(const std::string& db_path);

    // Files given on the server's own command line.
    void open_startup_files(const std::vector<std::string>& files);

    // Apply everything queued on the channel. Returns the number applied.
    size_t pump();

    std::vector<RecentFile> recent(int limit);

    // <data-dir>/history.db, or a per-user directory under /tmp.
    static std::string history_path();

    void shutdown();

private:
    void apply(const UiSignal& signal);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;
    UiChannel& channel_;
    UiLayer& ui_;
    HistoryDb history_db_;
};
