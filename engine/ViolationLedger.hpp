#pragma once

#include <cstdint>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace fence {

// Per-actor violation counters and the set of actors enforcement has been
// issued for. Both only grow for the lifetime of the ledger. Writes come from
// the control loop thread; reads may come from any thread.
class ViolationLedger {
public:
    ViolationLedger() = default;

    ViolationLedger(const ViolationLedger&) = delete;
    ViolationLedger& operator=(const ViolationLedger&) = delete;

    // Returns the actor's count after the increment.
    uint32_t RecordViolation(uint32_t pid);

    // Returns true if `pid` was not in the blocked set before the call.
    bool MarkBlocked(uint32_t pid);

    uint64_t GetTotalViolations() const;
    uint32_t GetViolationCount(uint32_t pid) const;
    bool HasBlockedActors() const;
    bool IsBlocked(uint32_t pid) const;
    std::vector<uint32_t> GetBlockedPids() const;
    size_t GetTrackedPidCount() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<uint32_t, uint32_t> violation_counts_;
    std::unordered_set<uint32_t> blocked_pids_;
};

} // namespace fence
