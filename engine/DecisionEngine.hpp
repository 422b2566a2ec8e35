#pragma once

#include "core/Config.hpp"
#include "core/EventBus.hpp"
#include "engine/ViolationLedger.hpp"
#include "source/EventSource.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace fence {

enum class DecisionOutcome {
    FILTERED,      // actor outside the target filter
    ALLOWED,       // path matched no disallowed pattern
    VIOLATION,     // counted, still below threshold or already blocked
    BLOCKED,       // threshold crossed, enforcement issued
    BLOCK_FAILED   // threshold crossed, enforcement call failed
};

struct Decision {
    DecisionOutcome outcome;
    uint32_t count;               // actor's violation count after this event
    std::string error_message;    // set for BLOCK_FAILED

    bool Ok() const { return outcome != DecisionOutcome::BLOCK_FAILED; }
};

// Applies the policy to one event at a time and issues the block command the
// first time an actor reaches the threshold. Owns the session's ledger.
class DecisionEngine {
public:
    // `source` and `bus` must outlive the engine; `bus` may be null.
    // Throws std::invalid_argument if policy.threshold is zero.
    DecisionEngine(PolicyConfig policy, EventSource& source, EventBus* bus = nullptr);

    DecisionEngine(const DecisionEngine&) = delete;
    DecisionEngine& operator=(const DecisionEngine&) = delete;

    Decision Process(const AccessEvent& event);

    const PolicyConfig& GetPolicy() const { return policy_; }

    // Safe to call from any thread while Process() runs on the loop thread.
    uint64_t GetViolationCount() const { return ledger_.GetTotalViolations(); }
    uint32_t GetViolationCount(uint32_t pid) const { return ledger_.GetViolationCount(pid); }
    bool IsBlocked() const { return ledger_.HasBlockedActors(); }
    bool IsBlocked(uint32_t pid) const { return ledger_.IsBlocked(pid); }
    std::vector<uint32_t> GetBlockedPids() const { return ledger_.GetBlockedPids(); }
    size_t GetTrackedPidCount() const { return ledger_.GetTrackedPidCount(); }

private:
    void Notify(NotificationType type, const AccessEvent& event, uint32_t count,
                const std::string& error_message = "");

    const PolicyConfig policy_;
    EventSource& source_;
    EventBus* bus_;
    ViolationLedger ledger_;
};

inline std::string DecisionOutcomeToString(DecisionOutcome outcome) {
    switch (outcome) {
        case DecisionOutcome::FILTERED:     return "FILTERED";
        case DecisionOutcome::ALLOWED:      return "ALLOWED";
        case DecisionOutcome::VIOLATION:    return "VIOLATION";
        case DecisionOutcome::BLOCKED:      return "BLOCKED";
        case DecisionOutcome::BLOCK_FAILED: return "BLOCK_FAILED";
        default:                            return "UNKNOWN";
    }
}

} // namespace fence
