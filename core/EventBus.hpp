#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

// Forward declare ThreadPool to avoid circular includes
namespace fence { class ThreadPool; }

namespace fence {

enum class NotificationType {
    ACCESS_VIOLATION,
    ACTOR_BLOCKED,
    BLOCK_FAILED
};

// Observable outcome of the decision engine. One is published per violation
// and one per enforcement attempt.
struct Notification {
    NotificationType type;
    uint64_t timestamp;
    uint32_t pid;
    std::string process_name;
    std::string file_path;
    uint32_t count{0};
    uint32_t threshold{0};
    std::string error_message;

    Notification(NotificationType t, uint32_t p, const std::string& name)
        : type(t), timestamp(GetCurrentTimestamp()), pid(p), process_name(name) {}

private:
    static uint64_t GetCurrentTimestamp();
};

using NotificationHandler = std::function<void(const Notification&)>;
using SubscriptionId = uint64_t;

// Per-session publish/subscribe hub. Owned by the application (or a test
// fixture) and handed to producers by pointer.
class EventBus {
public:
    EventBus();
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    SubscriptionId Subscribe(NotificationType type, NotificationHandler handler);
    void Unsubscribe(SubscriptionId id);
    void Publish(const Notification& notification);
    void PublishAsync(Notification notification);

    // Starts the internal thread pool used by PublishAsync(). Without it,
    // PublishAsync() delivers synchronously.
    void InitAsyncPool(size_t num_threads = 1);

    // Blocks until every async delivery queued so far has run.
    void Flush();

    // Drains pending async deliveries and stops the pool.
    void ShutdownAsyncPool();

    size_t GetSubscriberCount(NotificationType type) const;
    void Clear();

private:
    mutable std::mutex mutex_;
    std::unordered_map<NotificationType, std::vector<std::pair<SubscriptionId, NotificationHandler>>> subscribers_;
    SubscriptionId next_id_ = 1;

    std::unique_ptr<ThreadPool> async_pool_;
};

inline std::string NotificationTypeToString(NotificationType type) {
    switch (type) {
        case NotificationType::ACCESS_VIOLATION: return "ACCESS_VIOLATION";
        case NotificationType::ACTOR_BLOCKED:    return "ACTOR_BLOCKED";
        case NotificationType::BLOCK_FAILED:     return "BLOCK_FAILED";
        default:                                 return "UNKNOWN";
    }
}

} // namespace fence
