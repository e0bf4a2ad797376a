#pragma once

#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

enum class UiSignalKind { Open, Focus };

struct UiSignal {
    UiSignalKind kind = UiSignalKind::Focus;
    std::string path;  // Open only

    static UiSignal open(std::string path) { return {UiSignalKind::Open, std::move(path)}; }
    static UiSignal focus() { return {UiSignalKind::Focus, {}}; }
};

// Queue from the IPC thread to the UI loop. event_fd() turns readable while
// signals are pending (or once the channel is closed), so the UI side can
// sleep in epoll instead of polling.
class UiChannel {
public:
    UiChannel();
    ~UiChannel();

    UiChannel(const UiChannel&) = delete;
    UiChannel& operator=(const UiChannel&) = delete;

    bool init();

    // Returns false once the channel is closed.
    bool send(UiSignal signal);

    // Consumer: take everything queued so far and reset the eventfd.
    std::vector<UiSignal> drain();
    std::optional<UiSignal> try_recv();

    void close();
    bool closed() const;

    int event_fd() const { return event_fd_; }

private:
    void notify();
    void clear_notification();

    mutable std::mutex mutex_;
    std::deque<UiSignal> queue_;
    bool closed_ = false;
    int event_fd_ = -1;
};
