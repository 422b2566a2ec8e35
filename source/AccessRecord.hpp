#pragma once

#include "source/AccessEvent.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace fence {

// Size of `struct event_t` emitted by bpf/deny_file_open.bpf.c:
// u32 pid, u32 uid, char comm[16], char filename[256], s32 flags.
constexpr size_t kAccessRecordSize = 4 + 4 + kProcessNameSize + kFilePathSize + 4;

// Decodes one little-endian ring buffer sample. Returns nullopt if `size` is
// smaller than a full record; extra trailing bytes are ignored.
std::optional<AccessEvent> DecodeAccessRecord(const void* data, size_t size);

// Inverse of DecodeAccessRecord(); strings longer than their field are cut.
// Used by tests and the replay tooling to produce wire-identical samples.
std::vector<uint8_t> EncodeAccessRecord(const AccessEvent& event);

} // namespace fence
