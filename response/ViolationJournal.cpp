#include "response/ViolationJournal.hpp"
#include "core/Logger.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>

namespace fence {

ViolationJournal::ViolationJournal() = default;

ViolationJournal::~ViolationJournal() {
    Stop();
}

bool ViolationJournal::Initialize(const std::string& path, EventBus* bus) {
    if (!bus) {
        LOG_ERROR("ViolationJournal::Initialize called with null EventBus");
        return false;
    }

    try {
        std::filesystem::path journal_path(path);
        if (journal_path.has_parent_path()) {
            std::filesystem::create_directories(journal_path.parent_path());
        }
    } catch (const std::exception& ex) {
        LOG_ERROR("Failed to create journal directory for {}: {}", path, ex.what());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    out_.open(path, std::ios::out | std::ios::app);
    if (!out_.is_open()) {
        LOG_ERROR("Failed to open violation journal {}", path);
        return false;
    }

    path_ = path;
    bus_ = bus;
    LOG_INFO("Violation journal: {}", path_);
    return true;
}

void ViolationJournal::Start() {
    if (running_) {
        LOG_WARN("ViolationJournal already running");
        return;
    }
    if (!bus_) {
        LOG_WARN("ViolationJournal not initialized, not starting");
        return;
    }

    for (auto type : {NotificationType::ACCESS_VIOLATION,
                      NotificationType::ACTOR_BLOCKED,
                      NotificationType::BLOCK_FAILED}) {
        subscriptions_.push_back(bus_->Subscribe(
            type, [this](const Notification& notification) { OnNotification(notification); }));
    }

    running_ = true;
    LOG_DEBUG("ViolationJournal started");
}

void ViolationJournal::Stop() {
    if (!running_) {
        return;
    }

    for (SubscriptionId id : subscriptions_) {
        bus_->Unsubscribe(id);
    }
    subscriptions_.clear();

    // Deliveries already queued on the bus still land in the file.
    bus_->Flush();

    std::lock_guard<std::mutex> lock(mutex_);
    out_.flush();
    running_ = false;
    LOG_DEBUG("ViolationJournal stopped ({} records)", record_count_.load());
}

std::string ViolationJournal::FormatRecord(const Notification& notification) {
    nlohmann::json record;
    record["type"] = NotificationTypeToString(notification.type);
    record["timestamp"] = notification.timestamp;
    record["pid"] = notification.pid;
    record["process_name"] = notification.process_name;
    record["file_path"] = notification.file_path;
    record["count"] = notification.count;
    record["threshold"] = notification.threshold;
    if (notification.type == NotificationType::BLOCK_FAILED) {
        record["error"] = notification.error_message;
    }
    // Paths come from the kernel and are not guaranteed to be UTF-8.
    return record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void ViolationJournal::OnNotification(const Notification& notification) {
    std::string line = FormatRecord(notification);

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << '\n';
    out_.flush();
    if (!out_) {
        LOG_ERROR("Failed to write violation journal record to {}", path_);
        out_.clear();
        return;
    }
    record_count_++;
}

} // namespace fence
