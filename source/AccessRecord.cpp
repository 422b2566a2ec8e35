#include "source/AccessRecord.hpp"
#include <algorithm>
#include <cstring>

namespace fence {

namespace {

constexpr size_t kPidOffset = 0;
constexpr size_t kUidOffset = 4;
constexpr size_t kCommOffset = 8;
constexpr size_t kFilenameOffset = kCommOffset + kProcessNameSize;
constexpr size_t kFlagsOffset = kFilenameOffset + kFilePathSize;

uint32_t ReadU32LE(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

void WriteU32LE(uint8_t* p, uint32_t value) {
    p[0] = static_cast<uint8_t>(value & 0xFF);
    p[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
    p[2] = static_cast<uint8_t>((value >> 16) & 0xFF);
    p[3] = static_cast<uint8_t>((value >> 24) & 0xFF);
}

} // namespace

std::string TrimAtNul(const char* data, size_t max_len) {
    const char* end = static_cast<const char*>(std::memchr(data, '\0', max_len));
    return std::string(data, end ? static_cast<size_t>(end - data) : max_len);
}

AccessEvent MakeBoundedEvent(uint32_t pid, uint32_t uid, const std::string& process_name,
                             const std::string& file_path, int32_t flags) {
    return AccessEvent(pid, uid,
                       TrimAtNul(process_name.data(), std::min(process_name.size(), kProcessNameSize)),
                       TrimAtNul(file_path.data(), std::min(file_path.size(), kFilePathSize)),
                       flags);
}

std::optional<AccessEvent> DecodeAccessRecord(const void* data, size_t size) {
    if (data == nullptr || size < kAccessRecordSize) {
        return std::nullopt;
    }

    const auto* bytes = static_cast<const uint8_t*>(data);

    AccessEvent event;
    event.pid = ReadU32LE(bytes + kPidOffset);
    event.uid = ReadU32LE(bytes + kUidOffset);
    event.process_name = TrimAtNul(reinterpret_cast<const char*>(bytes + kCommOffset), kProcessNameSize);
    event.file_path = TrimAtNul(reinterpret_cast<const char*>(bytes + kFilenameOffset), kFilePathSize);
    event.flags = static_cast<int32_t>(ReadU32LE(bytes + kFlagsOffset));
    return event;
}

std::vector<uint8_t> EncodeAccessRecord(const AccessEvent& event) {
    std::vector<uint8_t> record(kAccessRecordSize, 0);

    WriteU32LE(record.data() + kPidOffset, event.pid);
    WriteU32LE(record.data() + kUidOffset, event.uid);
    std::memcpy(record.data() + kCommOffset, event.process_name.data(),
                std::min(event.process_name.size(), kProcessNameSize));
    std::memcpy(record.data() + kFilenameOffset, event.file_path.data(),
                std::min(event.file_path.size(), kFilePathSize));
    WriteU32LE(record.data() + kFlagsOffset, static_cast<uint32_t>(event.flags));
    return record;
}

} // namespace fence
