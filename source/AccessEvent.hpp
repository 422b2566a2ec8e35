#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace fence {

// Field bounds of the kernel capture record.
constexpr size_t kProcessNameSize = 16;
constexpr size_t kFilePathSize = 256;

// One observed file-open attempt, already decoded from the capture record.
struct AccessEvent {
    uint32_t pid;
    uint32_t uid;               // informational
    std::string process_name;
    std::string file_path;
    int32_t flags;              // informational

    AccessEvent() : pid(0), uid(0), flags(0) {}
    AccessEvent(uint32_t p, uint32_t u, const std::string& name, const std::string& path, int32_t f = 0)
        : pid(p), uid(u), process_name(name), file_path(path), flags(f) {}
};

// Builds an event with the same bounding the kernel applies: each string is
// cut at its first NUL and at the field size.
AccessEvent MakeBoundedEvent(uint32_t pid, uint32_t uid, const std::string& process_name,
                             const std::string& file_path, int32_t flags = 0);

// Returns the bytes of `data` up to the first NUL or `max_len`, whichever
// comes first.
std::string TrimAtNul(const char* data, size_t max_len);

} // namespace fence
