#include "engine/ControlLoop.hpp"
#include "core/Logger.hpp"
#include <fmt/ranges.h>

namespace fence {

ControlLoop::ControlLoop(EventSource& source, DecisionEngine& engine)
    : source_(source), engine_(engine) {
}

ActionResult ControlLoop::Run(const CancellationToken& cancel) {
    if (running_.exchange(true)) {
        LOG_WARN("ControlLoop already running");
        return ActionResult::Failure("control loop already running");
    }

    LogPolicy();

    while (true) {
        if (cancel.IsCancelled()) {
            break;
        }

        ReadResult read = source_.Next(cancel);

        if (read.status == ReadStatus::CANCELLED) {
            break;
        }

        if (read.status == ReadStatus::ERROR) {
            // A closed source races with shutdown; cancellation wins.
            if (cancel.IsCancelled()) {
                break;
            }
            read_errors_++;
            LOG_ERROR("reading event: {}", read.error_message);
            continue;
        }

        Decision decision = engine_.Process(read.event);
        LOG_DEBUG("PID {} ({}) {} -> {}", read.event.pid, read.event.process_name,
                  read.event.file_path, DecisionOutcomeToString(decision.outcome));
        if (!decision.Ok()) {
            process_errors_++;
            LOG_ERROR("processing event: {}", decision.error_message);
        }
        events_processed_++;
    }

    LOG_INFO("ControlLoop stopped (events={}, read_errors={}, process_errors={})",
             events_processed_.load(), read_errors_.load(), process_errors_.load());
    running_ = false;
    return ActionResult::Ok();
}

void ControlLoop::LogPolicy() const {
    const PolicyConfig& policy = engine_.GetPolicy();

    LOG_INFO("Disallowed files: [{}]", fmt::join(policy.disallowed_patterns, ", "));
    LOG_INFO("Threshold: {} file(s)", policy.threshold);
    if (policy.target_pid != kAllPids) {
        LOG_INFO("Target PID: {}", policy.target_pid);
    } else {
        LOG_INFO("Target PID: all processes");
    }
}

} // namespace fence
