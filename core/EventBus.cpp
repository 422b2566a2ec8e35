#include "core/EventBus.hpp"
#include "core/Logger.hpp"
#include "core/ThreadPool.hpp"
#include <chrono>
#include <algorithm>

namespace fence {

uint64_t Notification::GetCurrentTimestamp() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

EventBus::EventBus() = default;

EventBus::~EventBus() {
    ShutdownAsyncPool();
}

SubscriptionId EventBus::Subscribe(NotificationType type, NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    subscribers_[type].emplace_back(id, std::move(handler));
    return id;
}

void EventBus::Unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [type, handlers] : subscribers_) {
        handlers.erase(
            std::remove_if(handlers.begin(), handlers.end(),
                [id](const auto& pair) { return pair.first == id; }),
            handlers.end()
        );
    }
}

void EventBus::Publish(const Notification& notification) {
    std::vector<NotificationHandler> handlers_copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribers_.find(notification.type);
        if (it != subscribers_.end()) {
            handlers_copy.reserve(it->second.size());
            for (const auto& [id, handler] : it->second) {
                handlers_copy.push_back(handler);
            }
        }
    }

    for (const auto& handler : handlers_copy) {
        try {
            handler(notification);
        } catch (const std::exception& ex) {
            LOG_ERROR("Subscriber for {} threw: {}",
                      NotificationTypeToString(notification.type), ex.what());
        }
    }
}

void EventBus::PublishAsync(Notification notification) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (async_pool_) {
        // Enqueue under the lock so ShutdownAsyncPool() cannot race the pool away.
        async_pool_->Enqueue([this, notification = std::move(notification)]() {
            Publish(notification);
        });
        return;
    }
    lock.unlock();
    Publish(notification);
}

void EventBus::InitAsyncPool(size_t num_threads) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!async_pool_) {
        async_pool_ = std::make_unique<ThreadPool>(num_threads);
    }
}

void EventBus::Flush() {
    ThreadPool* pool = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pool = async_pool_.get();
    }
    if (pool) {
        pool->WaitIdle();
    }
}

void EventBus::ShutdownAsyncPool() {
    std::unique_ptr<ThreadPool> pool;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pool = std::move(async_pool_);
    }
    if (pool) {
        pool->Shutdown();
    }
}

size_t EventBus::GetSubscriberCount(NotificationType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscribers_.find(type);
    return it != subscribers_.end() ? it->second.size() : 0;
}

void EventBus::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.clear();
}

} // namespace fence
