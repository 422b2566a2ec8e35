#include "engine/DecisionEngine.hpp"
#include "engine/PatternMatcher.hpp"
#include "core/Logger.hpp"
#include <stdexcept>

namespace fence {

DecisionEngine::DecisionEngine(PolicyConfig policy, EventSource& source, EventBus* bus)
    : policy_(std::move(policy)), source_(source), bus_(bus) {
    if (policy_.threshold == 0) {
        throw std::invalid_argument("DecisionEngine threshold must be at least 1");
    }
}

Decision DecisionEngine::Process(const AccessEvent& event) {
    if (policy_.target_pid != kAllPids && event.pid != policy_.target_pid) {
        return Decision{DecisionOutcome::FILTERED, 0, ""};
    }

    if (!PatternMatcher::Matches(event.file_path, policy_.disallowed_patterns)) {
        return Decision{DecisionOutcome::ALLOWED, ledger_.GetViolationCount(event.pid), ""};
    }

    const uint32_t count = ledger_.RecordViolation(event.pid);

    LOG_WARN("[VIOLATION {}/{}] PID {} ({}) opened disallowed file: {}",
             count, policy_.threshold, event.pid, event.process_name, event.file_path);
    Notify(NotificationType::ACCESS_VIOLATION, event, count);

    // MarkBlocked() only succeeds once per pid, so Block() runs exactly once
    // even though later violations keep counting.
    if (count < policy_.threshold || !ledger_.MarkBlocked(event.pid)) {
        return Decision{DecisionOutcome::VIOLATION, count, ""};
    }

    // The pid stays marked even if enforcement fails.
    ActionResult result = source_.Block(event.pid);
    if (!result.success) {
        LOG_ERROR("Failed to block PID {} ({}): {}", event.pid, event.process_name, result.error_message);
        Notify(NotificationType::BLOCK_FAILED, event, count, result.error_message);
        return Decision{DecisionOutcome::BLOCK_FAILED, count, "failed to block PID: " + result.error_message};
    }

    LOG_CRITICAL("*** PID {} ({}) is now BLOCKED from opening any further files! ***",
                 event.pid, event.process_name);
    Notify(NotificationType::ACTOR_BLOCKED, event, count);
    return Decision{DecisionOutcome::BLOCKED, count, ""};
}

void DecisionEngine::Notify(NotificationType type, const AccessEvent& event, uint32_t count,
                            const std::string& error_message) {
    if (!bus_) {
        return;
    }

    Notification notification(type, event.pid, event.process_name);
    notification.file_path = event.file_path;
    notification.count = count;
    notification.threshold = policy_.threshold;
    notification.error_message = error_message;
    bus_->PublishAsync(std::move(notification));
}

} // namespace fence
