#include "source/BpfEventSource.hpp"
#include "source/AccessRecord.hpp"
#include "core/Logger.hpp"

#include <bpf/bpf.h>
#include <bpf/libbpf.h>

#include <cerrno>
#include <cstring>

namespace fence {

namespace {

constexpr const char* kEventsMap = "events";
constexpr const char* kBlockedPidsMap = "blocked_pids";
constexpr const char* kLsmProgram = "deny_file_open";
constexpr const char* kOpenatProgram = "trace_openat";
constexpr const char* kOpenat2Program = "trace_openat2";

std::string ErrnoString(int err) {
    return std::strerror(err < 0 ? -err : err);
}

} // namespace

BpfEventSource::BpfEventSource(std::chrono::milliseconds poll_interval)
    : poll_interval_(poll_interval) {
}

BpfEventSource::~BpfEventSource() {
    ActionResult result = Close();
    if (!result.success) {
        LOG_ERROR("Failed to release eBPF resources: {}", result.error_message);
    }
}

ActionResult BpfEventSource::Open(const std::string& object_path) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (opened_ || closed_) {
        return ActionResult::Failure("source already opened");
    }

    object_ = bpf_object__open_file(object_path.c_str(), nullptr);
    if (!object_) {
        int err = errno;
        return ActionResult::Failure("open bpf object " + object_path + ": " + ErrnoString(err));
    }

    int err = bpf_object__load(object_);
    if (err) {
        std::vector<std::string> ignored;
        ReleaseLocked(&ignored);
        return ActionResult::Failure("load bpf object: " + ErrnoString(err));
    }

    blocked_pids_ = bpf_object__find_map_by_name(object_, kBlockedPidsMap);
    bpf_map* events = bpf_object__find_map_by_name(object_, kEventsMap);
    if (!blocked_pids_ || !events) {
        std::vector<std::string> ignored;
        ReleaseLocked(&ignored);
        return ActionResult::Failure("bpf object is missing the events or blocked_pids map");
    }

    // The LSM hook performs the actual denial; without it blocking is a no-op.
    ActionResult attach = AttachProgram(kLsmProgram, true, &lsm_link_);
    if (attach.success) {
        attach = AttachProgram(kOpenatProgram, true, &openat_link_);
    }
    if (!attach.success) {
        std::vector<std::string> ignored;
        ReleaseLocked(&ignored);
        return attach;
    }

    // openat2 is missing on older kernels.
    ActionResult optional = AttachProgram(kOpenat2Program, false, &openat2_link_);
    if (!optional.success) {
        LOG_WARN("Could not attach openat2 tracepoint: {}", optional.error_message);
    }

    ring_buffer_ = ring_buffer__new(bpf_map__fd(events), &BpfEventSource::HandleSample, this, nullptr);
    if (!ring_buffer_) {
        int rb_err = errno;
        std::vector<std::string> ignored;
        ReleaseLocked(&ignored);
        return ActionResult::Failure("open ring buffer: " + ErrnoString(rb_err));
    }

    opened_ = true;
    LOG_INFO("eBPF programs loaded and attached from {}", object_path);
    return ActionResult::Ok();
}

ActionResult BpfEventSource::AttachProgram(const char* name, bool required, bpf_link** link) {
    bpf_program* program = bpf_object__find_program_by_name(object_, name);
    if (!program) {
        return ActionResult::Failure(std::string("program not found: ") + name);
    }

    *link = bpf_program__attach(program);
    if (!*link) {
        int err = errno;
        return ActionResult::Failure(std::string("attach ") + name + ": " + ErrnoString(err));
    }

    LOG_DEBUG("Attached {} program {}", required ? "required" : "optional", name);
    return ActionResult::Ok();
}

int BpfEventSource::HandleSample(void* ctx, void* data, size_t size) {
    // Invoked from ring_buffer__poll() while mutex_ is held by Next().
    auto* self = static_cast<BpfEventSource*>(ctx);

    auto event = DecodeAccessRecord(data, size);
    if (!event) {
        self->malformed_samples_++;
        return 0;
    }

    self->pending_.push_back(std::move(*event));
    return 0;
}

ReadResult BpfEventSource::Next(const CancellationToken& cancel) {
    while (true) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (closed_) {
            return ReadResult::Error("source is closed");
        }
        if (!opened_) {
            return ReadResult::Error("source is not open");
        }

        if (!pending_.empty()) {
            AccessEvent event = std::move(pending_.front());
            pending_.pop_front();
            return ReadResult::Event(std::move(event));
        }

        if (malformed_samples_ > 0) {
            size_t count = malformed_samples_;
            malformed_samples_ = 0;
            return ReadResult::Error("parsing event: " + std::to_string(count) +
                                     " ring buffer sample(s) shorter than " +
                                     std::to_string(kAccessRecordSize) + " bytes");
        }

        if (cancel.IsCancelled()) {
            return ReadResult::Cancelled();
        }

        // Bounded poll so the cancellation token is observed promptly.
        int err = ring_buffer__poll(ring_buffer_, static_cast<int>(poll_interval_.count()));
        if (err == -EINTR) {
            continue;
        }
        if (err < 0) {
            return ReadResult::Error("reading from ring buffer: " + ErrnoString(err));
        }
    }
}

ActionResult BpfEventSource::Block(uint32_t pid) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (closed_) {
        return ActionResult::Failure("source is closed");
    }
    if (!opened_) {
        return ActionResult::Failure("source is not open");
    }

    uint8_t blocked_value = 1;
    int err = bpf_map_update_elem(bpf_map__fd(blocked_pids_), &pid, &blocked_value, BPF_ANY);
    if (err) {
        return ActionResult::Failure("failed to update blocked_pids map: " + ErrnoString(errno));
    }
    return ActionResult::Ok();
}

ActionResult BpfEventSource::Close() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (closed_) {
        return ActionResult::Ok();
    }
    closed_ = true;

    std::vector<std::string> errors;
    ReleaseLocked(&errors);
    pending_.clear();

    if (errors.empty()) {
        return ActionResult::Ok();
    }

    std::string message = "errors closing provider:";
    for (const auto& error : errors) {
        message += " [" + error + "]";
    }
    return ActionResult::Failure(message);
}

void BpfEventSource::ReleaseLocked(std::vector<std::string>* errors) {
    if (ring_buffer_) {
        ring_buffer__free(ring_buffer_);
        ring_buffer_ = nullptr;
    }

    struct NamedLink {
        const char* name;
        bpf_link** link;
    };
    const NamedLink links[] = {
        {"openat2 link", &openat2_link_},
        {"openat link", &openat_link_},
        {"lsm link", &lsm_link_},
    };

    for (const auto& entry : links) {
        if (*entry.link) {
            int err = bpf_link__destroy(*entry.link);
            if (err) {
                errors->push_back(std::string("close ") + entry.name + ": " + ErrnoString(err));
            }
            *entry.link = nullptr;
        }
    }

    if (object_) {
        bpf_object__close(object_);
        object_ = nullptr;
    }
    blocked_pids_ = nullptr;
    opened_ = false;
}

} // namespace fence
