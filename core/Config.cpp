#include "core/Config.hpp"
#include <yaml-cpp/yaml.h>
#include <sstream>

namespace fence {

void LoadConfigFile(const std::string& path, FenceConfig& config) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& ex) {
        throw ConfigError("failed to load config file " + path + ": " + ex.what());
    }

    try {
        if (const auto policy = root["policy"]) {
            if (policy["disallowed"]) {
                config.policy.disallowed_patterns.clear();
                for (const auto& pattern : policy["disallowed"]) {
                    config.policy.disallowed_patterns.push_back(pattern.as<std::string>());
                }
            }
            if (policy["threshold"]) {
                config.policy.threshold = policy["threshold"].as<uint32_t>();
            }
            if (policy["target_pid"]) {
                config.policy.target_pid = policy["target_pid"].as<uint32_t>();
            }
        }

        if (const auto logging = root["logging"]) {
            if (logging["file"]) {
                config.logging.file = logging["file"].as<std::string>();
            }
            if (logging["level"]) {
                std::string level = logging["level"].as<std::string>();
                if (!ParseLogLevel(level, config.logging.level)) {
                    throw ConfigError("unknown logging.level '" + level + "' in " + path);
                }
            }
        }

        if (root["journal"] && root["journal"]["path"]) {
            config.journal_path = root["journal"]["path"].as<std::string>();
        }

        if (root["source"]) {
            if (root["source"]["bpf_object"]) {
                config.bpf_object = root["source"]["bpf_object"].as<std::string>();
            }
            if (root["source"]["replay"]) {
                config.replay_path = root["source"]["replay"].as<std::string>();
            }
        }
    } catch (const YAML::Exception& ex) {
        throw ConfigError("invalid value in config file " + path + ": " + ex.what());
    }

    LOG_DEBUG("Loaded configuration from {}", path);
}

std::vector<std::string> ParsePatternList(const std::string& list) {
    std::vector<std::string> patterns;
    std::stringstream stream(list);
    std::string item;

    while (std::getline(stream, item, ',')) {
        const auto first = item.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) {
            continue;
        }
        const auto last = item.find_last_not_of(" \t\r\n");
        patterns.push_back(item.substr(first, last - first + 1));
    }

    return patterns;
}

void ValidateConfig(const FenceConfig& config) {
    if (config.policy.disallowed_patterns.empty()) {
        throw ConfigError("no disallowed patterns configured (use --disallowed or policy.disallowed)");
    }
    if (config.policy.threshold == 0) {
        throw ConfigError("threshold must be at least 1");
    }
}

} // namespace fence
