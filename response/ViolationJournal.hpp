#pragma once

#include "core/EventBus.hpp"
#include <atomic>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace fence {

// Appends every violation and enforcement notification to a JSON-lines file.
// The file is an audit trail only; it is never read back.
class ViolationJournal {
public:
    ViolationJournal();
    ~ViolationJournal();

    ViolationJournal(const ViolationJournal&) = delete;
    ViolationJournal& operator=(const ViolationJournal&) = delete;

    // Opens `path` for appending, creating parent directories.
    bool Initialize(const std::string& path, EventBus* bus);
    void Start();
    void Stop();

    size_t GetRecordCount() const { return record_count_; }

    // One JSON object, no trailing newline.
    static std::string FormatRecord(const Notification& notification);

private:
    void OnNotification(const Notification& notification);

    std::string path_;
    EventBus* bus_{nullptr};
    std::ofstream out_;

    std::mutex mutex_;
    std::vector<SubscriptionId> subscriptions_;
    std::atomic<bool> running_{false};
    std::atomic<size_t> record_count_{0};
};

} // namespace fence
