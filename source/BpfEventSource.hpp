#pragma once

#include "source/EventSource.hpp"
#include <chrono>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

struct bpf_object;
struct bpf_map;
struct bpf_link;
struct ring_buffer;

namespace fence {

// Production EventSource backed by the eBPF object built from
// bpf/deny_file_open.bpf.c: open events arrive through the `events` ring
// buffer and blocking writes into the `blocked_pids` map consulted by the
// LSM file_open hook. Requires root (CAP_BPF + CAP_SYS_ADMIN) and a kernel
// with BPF LSM enabled.
class BpfEventSource : public EventSource {
public:
    explicit BpfEventSource(std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));
    ~BpfEventSource() override;

    BpfEventSource(const BpfEventSource&) = delete;
    BpfEventSource& operator=(const BpfEventSource&) = delete;

    // Loads the object file and attaches every program. On failure all
    // partially acquired resources are released.
    ActionResult Open(const std::string& object_path);

    ReadResult Next(const CancellationToken& cancel) override;
    ActionResult Block(uint32_t pid) override;
    ActionResult Close() override;

private:
    static int HandleSample(void* ctx, void* data, size_t size);
    ActionResult AttachProgram(const char* name, bool required, bpf_link** link);
    void ReleaseLocked(std::vector<std::string>* errors);

    std::chrono::milliseconds poll_interval_;

    mutable std::mutex mutex_;
    bpf_object* object_{nullptr};
    bpf_map* blocked_pids_{nullptr};
    bpf_link* lsm_link_{nullptr};
    bpf_link* openat_link_{nullptr};
    bpf_link* openat2_link_{nullptr};
    ring_buffer* ring_buffer_{nullptr};

    std::deque<AccessEvent> pending_;
    size_t malformed_samples_{0};
    bool opened_{false};
    bool closed_{false};
};

} // namespace fence
