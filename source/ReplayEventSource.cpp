#include "source/ReplayEventSource.hpp"
#include "core/Logger.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace fence {

namespace {

constexpr const char* kClosedError = "source is closed";

// nlohmann's get<uint32_t>() is a plain cast, so -1 or 2^32 would wrap
// silently. Reject anything outside the field's range instead.
uint32_t ReadUint32Field(const nlohmann::json& record, const char* key, bool required) {
    auto it = record.find(key);
    if (it == record.end()) {
        if (required) {
            throw std::invalid_argument(std::string("missing field '") + key + "'");
        }
        return 0;
    }
    if (!it->is_number_unsigned() ||
        it->get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
        throw std::invalid_argument(std::string("field '") + key + "' is not a 32-bit unsigned integer");
    }
    return static_cast<uint32_t>(it->get<uint64_t>());
}

int32_t ReadInt32Field(const nlohmann::json& record, const char* key) {
    auto it = record.find(key);
    if (it == record.end()) {
        return 0;
    }
    if (!it->is_number_integer()) {
        throw std::invalid_argument(std::string("field '") + key + "' is not an integer");
    }
    if (it->is_number_unsigned()) {
        if (it->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) {
            throw std::invalid_argument(std::string("field '") + key + "' is out of range");
        }
    } else {
        const int64_t value = it->get<int64_t>();
        if (value < std::numeric_limits<int32_t>::min() || value > std::numeric_limits<int32_t>::max()) {
            throw std::invalid_argument(std::string("field '") + key + "' is out of range");
        }
    }
    return static_cast<int32_t>(it->get<int64_t>());
}

} // namespace

ReplayEventSource::ReplayEventSource(std::vector<AccessEvent> events)
    : events_(std::move(events)) {
}

ReadResult ReplayEventSource::Next(const CancellationToken& cancel) {
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (closed_) {
            return ReadResult::Error(kClosedError);
        }

        if (cancel.IsCancelled()) {
            return ReadResult::Cancelled();
        }

        if (failing_reads_ > 0) {
            --failing_reads_;
            return ReadResult::Error("injected read failure");
        }

        if (current_index_ < events_.size()) {
            return ReadResult::Event(events_[current_index_++]);
        }
    }

    // Exhausted: park until the session is cancelled instead of spinning.
    cancel.Wait();
    return ReadResult::Cancelled();
}

ActionResult ReplayEventSource::Block(uint32_t pid) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (closed_) {
        return ActionResult::Failure(kClosedError);
    }

    if (!block_failure_.empty()) {
        return ActionResult::Failure(block_failure_);
    }

    block_calls_[pid]++;
    return ActionResult::Ok();
}

ActionResult ReplayEventSource::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    return ActionResult::Ok();
}

std::vector<AccessEvent> ReplayEventSource::LoadEventsFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("cannot open replay file: " + path);
    }

    std::vector<AccessEvent> events;
    std::string line;
    size_t line_number = 0;

    while (std::getline(in, line)) {
        ++line_number;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        try {
            auto record = nlohmann::json::parse(line);
            if (!record.is_object()) {
                throw std::invalid_argument("record is not a JSON object");
            }
            events.push_back(MakeBoundedEvent(
                ReadUint32Field(record, "pid", true),
                ReadUint32Field(record, "uid", false),
                record.value("comm", std::string()),
                record.at("filename").get<std::string>(),
                ReadInt32Field(record, "flags")));
        } catch (const nlohmann::json::exception& ex) {
            LOG_WARN("Skipping malformed replay record {}:{}: {}", path, line_number, ex.what());
        } catch (const std::invalid_argument& ex) {
            LOG_WARN("Skipping malformed replay record {}:{}: {}", path, line_number, ex.what());
        }
    }

    LOG_INFO("Loaded {} replay events from {}", events.size(), path);
    return events;
}

void ReplayEventSource::FailNextReads(size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_reads_ = count;
}

void ReplayEventSource::SetBlockFailure(const std::string& error_message) {
    std::lock_guard<std::mutex> lock(mutex_);
    block_failure_ = error_message;
}

bool ReplayEventSource::IsBlocked(uint32_t pid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return block_calls_.count(pid) > 0;
}

size_t ReplayEventSource::GetBlockCallCount(uint32_t pid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = block_calls_.find(pid);
    return it != block_calls_.end() ? it->second : 0;
}

size_t ReplayEventSource::GetRemainingEvents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size() - current_index_;
}

bool ReplayEventSource::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

} // namespace fence
