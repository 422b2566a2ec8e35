#include "engine/ViolationLedger.hpp"
#include <mutex>

namespace fence {

uint32_t ViolationLedger::RecordViolation(uint32_t pid) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return ++violation_counts_[pid];
}

bool ViolationLedger::MarkBlocked(uint32_t pid) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return blocked_pids_.insert(pid).second;
}

uint64_t ViolationLedger::GetTotalViolations() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    uint64_t total = 0;
    for (const auto& [pid, count] : violation_counts_) {
        total += count;
    }
    return total;
}

uint32_t ViolationLedger::GetViolationCount(uint32_t pid) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = violation_counts_.find(pid);
    return it != violation_counts_.end() ? it->second : 0;
}

bool ViolationLedger::HasBlockedActors() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return !blocked_pids_.empty();
}

bool ViolationLedger::IsBlocked(uint32_t pid) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return blocked_pids_.count(pid) > 0;
}

std::vector<uint32_t> ViolationLedger::GetBlockedPids() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return std::vector<uint32_t>(blocked_pids_.begin(), blocked_pids_.end());
}

size_t ViolationLedger::GetTrackedPidCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return violation_counts_.size();
}

} // namespace fence
