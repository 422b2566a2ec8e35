#pragma once

#include "source/EventSource.hpp"
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace fence {

// Deterministic EventSource: hands out a fixed event sequence in order, then
// blocks until cancellation. Backs the unit tests and the --replay dry run.
class ReplayEventSource : public EventSource {
public:
    explicit ReplayEventSource(std::vector<AccessEvent> events);
    ~ReplayEventSource() override = default;

    ReplayEventSource(const ReplayEventSource&) = delete;
    ReplayEventSource& operator=(const ReplayEventSource&) = delete;

    ReadResult Next(const CancellationToken& cancel) override;
    ActionResult Block(uint32_t pid) override;
    ActionResult Close() override;

    // Reads one JSON object per line:
    //   {"pid":1234,"uid":1000,"comm":"cat","filename":"/etc/passwd","flags":0}
    // Blank lines are ignored and malformed lines are skipped with a warning.
    // Throws std::runtime_error if the file cannot be opened.
    static std::vector<AccessEvent> LoadEventsFromFile(const std::string& path);

    // Failure injection for error-path tests.
    void FailNextReads(size_t count);
    void SetBlockFailure(const std::string& error_message);

    bool IsBlocked(uint32_t pid) const;
    size_t GetBlockCallCount(uint32_t pid) const;
    size_t GetRemainingEvents() const;
    bool IsClosed() const;

private:
    mutable std::mutex mutex_;
    std::vector<AccessEvent> events_;
    size_t current_index_{0};
    std::unordered_map<uint32_t, size_t> block_calls_;
    size_t failing_reads_{0};
    std::string block_failure_;
    bool closed_{false};
};

} // namespace fence
