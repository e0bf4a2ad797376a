#include "ui/ui_channel.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <print>
#include <sys/eventfd.h>
#include <unistd.h>

UiChannel::UiChannel() = default;

UiChannel::~UiChannel() {
    if (event_fd_ >= 0) ::close(event_fd_);
}

bool UiChannel::init() {
    event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (event_fd_ < 0) {
        std::println(stderr, "ui: eventfd failed: {}", std::strerror(errno));
        return false;
    }
    return true;
}

bool UiChannel::send(UiSignal signal) {
    {
        std::lock_guard lock(mutex_);
        if (closed_) return false;
        queue_.push_back(std::move(signal));
    }
    notify();
    return true;
}

std::vector<UiSignal> UiChannel::drain() {
    // Reset before taking the queue so a concurrent send re-arms the fd.
    clear_notification();

    std::lock_guard lock(mutex_);
    std::vector<UiSignal> out(std::make_move_iterator(queue_.begin()),
                              std::make_move_iterator(queue_.end()));
    queue_.clear();
    return out;
}

std::optional<UiSignal> UiChannel::try_recv() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) return std::nullopt;
    auto signal = std::move(queue_.front());
    queue_.pop_front();
    return signal;
}

void UiChannel::close() {
    {
        std::lock_guard lock(mutex_);
        if (closed_) return;
        closed_ = true;
    }
    notify();
}

bool UiChannel::closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

void UiChannel::notify() {
    if (event_fd_ < 0) return;
    uint64_t val = 1;
    ::write(event_fd_, &val, sizeof(val));
}

void UiChannel::clear_notification() {
    if (event_fd_ < 0) return;
    uint64_t val;
    ::read(event_fd_, &val, sizeof(val));
}
