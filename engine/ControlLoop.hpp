#pragma once

#include "core/CancellationToken.hpp"
#include "engine/DecisionEngine.hpp"
#include "source/EventSource.hpp"
#include <atomic>
#include <cstdint>

namespace fence {

// Single consumer that feeds every event from an EventSource into a
// DecisionEngine until the token is cancelled. Read and processing errors
// are logged and the loop keeps going; there is no backoff and no error
// budget, so a permanently failing source is retried at the loop's pace.
class ControlLoop {
public:
    ControlLoop(EventSource& source, DecisionEngine& engine);

    ControlLoop(const ControlLoop&) = delete;
    ControlLoop& operator=(const ControlLoop&) = delete;

    // Returns success when stopped by cancellation. Only returns a failure
    // if the loop is already running on another thread.
    ActionResult Run(const CancellationToken& cancel);

    bool IsRunning() const { return running_; }
    uint64_t GetEventsProcessed() const { return events_processed_; }
    uint64_t GetReadErrors() const { return read_errors_; }
    uint64_t GetProcessErrors() const { return process_errors_; }

private:
    void LogPolicy() const;

    EventSource& source_;
    DecisionEngine& engine_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> events_processed_{0};
    std::atomic<uint64_t> read_errors_{0};
    std::atomic<uint64_t> process_errors_{0};
};

} // namespace fence
