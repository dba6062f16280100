#ifndef CANCELLATION_TOKEN_HPP
#define CANCELLATION_TOKEN_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

// Cooperative cancellation flag shared between the party that cancels and
// the party that polls. Waiters wake up as soon as cancel() is called.
class CancellationToken {
public:
    void cancel();
    bool cancelled() const { return cancelled_.load(); }

    // Sleeps up to timeout; returns true if cancelled meanwhile.
    bool waitFor(std::chrono::milliseconds timeout) const;

    static std::shared_ptr<CancellationToken> create() { return std::make_shared<CancellationToken>(); }

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

#endif
