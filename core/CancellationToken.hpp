#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>

namespace fence {

// Cooperative cancellation signal shared between the control loop and every
// blocking event source call. Cancel() is sticky and may be called from any
// thread, including a signal-watcher thread.
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void Cancel();
    bool IsCancelled() const { return cancelled_.load(std::memory_order_acquire); }

    // Blocks until Cancel() is called.
    void Wait() const;

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable condition_;
};

} // namespace fence
