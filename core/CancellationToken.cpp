#include "core/CancellationToken.hpp"

namespace fence {

void CancellationToken::Cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(true, std::memory_order_release);
    }
    condition_.notify_all();
}

void CancellationToken::Wait() const {
    std::unique_lock<std::mutex> lock(mutex_);
    condition_.wait(lock, [this] { return cancelled_.load(std::memory_order_acquire); });
}

} // namespace fence
