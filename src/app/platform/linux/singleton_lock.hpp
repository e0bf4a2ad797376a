#pragma once

#include <string>

enum class LockResult {
    Acquired,
    Held,         // another process owns it
    Unavailable,  // lock file could not be opened or locked at all
};

// Advisory flock() on a per-user lock file. The kernel drops it when the
// holder exits, crashes included, so there is never a stale lock.
class SingletonLock {
public:
    SingletonLock();
    ~SingletonLock();

    SingletonLock(const SingletonLock&) = delete;
    SingletonLock& operator=(const SingletonLock&) = delete;

    LockResult acquire(const std::string& path);
    void release();

    bool held() const { return fd_ >= 0; }

private:
    int fd_ = -1;
};
