
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// Process-wide stop request shared by the poll loops and the reporter.
class CancellationToken {
public:
    void cancel();
    bool is_cancelled() const { return cancelled_.load(); }

    // Sleeps for up to `duration`; returns true if cancelled in the meantime
    bool wait_for(std::chrono::steady_clock::duration duration);

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};
