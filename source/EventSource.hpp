#pragma once

#include "core/CancellationToken.hpp"
#include "source/AccessEvent.hpp"
#include <cstdint>
#include <string>
#include <utility>

namespace fence {

struct ActionResult {
    bool success;
    std::string error_message;

    ActionResult(bool s = true, const std::string& err = "")
        : success(s), error_message(err) {}

    static ActionResult Ok() { return ActionResult(true); }
    static ActionResult Failure(const std::string& err) { return ActionResult(false, err); }
};

enum class ReadStatus {
    OK,
    CANCELLED,
    ERROR
};

struct ReadResult {
    ReadStatus status;
    AccessEvent event;
    std::string error_message;

    static ReadResult Event(AccessEvent e) { return ReadResult{ReadStatus::OK, std::move(e), ""}; }
    static ReadResult Cancelled() { return ReadResult{ReadStatus::CANCELLED, AccessEvent(), ""}; }
    static ReadResult Error(const std::string& err) { return ReadResult{ReadStatus::ERROR, AccessEvent(), err}; }
};

// Pull interface to the capture/enforcement subsystem.
class EventSource {
public:
    virtual ~EventSource() = default;

    // Blocks until an event is available, `cancel` fires, or an error
    // occurs. An exhausted source keeps blocking until cancellation.
    virtual ReadResult Next(const CancellationToken& cancel) = 0;

    // Denies the actor any further file opens. Tolerates repeated calls.
    virtual ActionResult Block(uint32_t pid) = 0;

    // Releases resources. Every later Next()/Block() fails.
    virtual ActionResult Close() = 0;
};

} // namespace fence
