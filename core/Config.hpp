#pragma once

#include "core/Logger.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace fence {

// Sentinel for PolicyConfig::target_pid meaning "every process".
constexpr uint32_t kAllPids = 0;

struct PolicyConfig {
    std::vector<std::string> disallowed_patterns;
    uint32_t threshold{2};
    uint32_t target_pid{kAllPids};
};

struct LoggingConfig {
    std::string file{"logs/ebpfence.log"};
    LogLevel level{LogLevel::INFO};
};

struct FenceConfig {
    PolicyConfig policy;
    LoggingConfig logging;
    std::string journal_path;                           // empty disables the journal
    std::string bpf_object{"bpf/deny_file_open.bpf.o"};
    std::string replay_path;                            // non-empty selects the replay source
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Overlays the keys present in a YAML file onto `config`. Missing keys keep
// their current value and unknown keys are ignored.
// Throws ConfigError if the file cannot be read or a value has the wrong type.
void LoadConfigFile(const std::string& path, FenceConfig& config);

// Splits a comma-separated pattern list, trimming whitespace around each
// entry and dropping empty entries.
std::vector<std::string> ParsePatternList(const std::string& list);

// Throws ConfigError if the policy cannot drive a session: no patterns, or a
// zero threshold.
void ValidateConfig(const FenceConfig& config);

} // namespace fence
