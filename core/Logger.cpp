#include "core/Logger.hpp"
#include <filesystem>
#include <cstdio>
#include <vector>

namespace fence {

namespace {
constexpr const char* kLoggerName = "ebpfence";
constexpr const char* kConsolePattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
}

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;
std::mutex Logger::mutex_;

bool ParseLogLevel(const std::string& name, LogLevel& level) {
    if (name == "trace")    { level = LogLevel::TRACE;    return true; }
    if (name == "debug")    { level = LogLevel::DEBUG;    return true; }
    if (name == "info")     { level = LogLevel::INFO;     return true; }
    if (name == "warn")     { level = LogLevel::WARN;     return true; }
    if (name == "error")    { level = LogLevel::ERROR;    return true; }
    if (name == "critical") { level = LogLevel::CRITICAL; return true; }
    return false;
}

void Logger::Initialize(const std::string& log_file_path, size_t max_file_size, size_t max_files) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        if (logger_) {
            spdlog::drop(kLoggerName);
            logger_ = nullptr;
        }

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(spdlog::level::info);
        console_sink->set_pattern(kConsolePattern);

        std::vector<spdlog::sink_ptr> sinks{console_sink};

        if (!log_file_path.empty()) {
            std::filesystem::path log_path(log_file_path);
            if (log_path.has_parent_path()) {
                std::filesystem::create_directories(log_path.parent_path());
            }

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file_path, max_file_size, max_files);
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file_sink);
        }

        logger_ = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
        logger_->set_level(spdlog::level::trace);
        logger_->flush_on(spdlog::level::warn);

        spdlog::register_logger(logger_);

        if (!log_file_path.empty()) {
            logger_->debug("Logger initialized: {}", log_file_path);
        }
    } catch (const std::exception& ex) {
        fprintf(stderr, "Failed to initialize logger: %s\n", ex.what());
        throw;
    }
}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_) return;

    spdlog::level::level_enum spd_level = spdlog::level::info;
    switch (level) {
        case LogLevel::TRACE:    spd_level = spdlog::level::trace; break;
        case LogLevel::DEBUG:    spd_level = spdlog::level::debug; break;
        case LogLevel::INFO:     spd_level = spdlog::level::info; break;
        case LogLevel::WARN:     spd_level = spdlog::level::warn; break;
        case LogLevel::ERROR:    spd_level = spdlog::level::err; break;
        case LogLevel::CRITICAL: spd_level = spdlog::level::critical; break;
    }

    // The console sink carries its own threshold; lowering the logger level
    // alone would not surface debug output on the terminal.
    logger_->set_level(spd_level);
    for (auto& sink : logger_->sinks()) {
        if (sink->level() > spd_level) {
            sink->set_level(spd_level);
        }
    }
}

void Logger::Shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) {
        logger_->flush();
        spdlog::drop(kLoggerName);
        logger_ = nullptr;
    }
}

std::shared_ptr<spdlog::logger> Logger::Get() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_) {
        logger_ = CreateConsoleLogger();
    }
    return logger_;
}

std::shared_ptr<spdlog::logger> Logger::CreateConsoleLogger() {
    // Used by tests and by code that logs before main() configures sinks.
    auto existing = spdlog::get(kLoggerName);
    if (existing) {
        return existing;
    }
    auto console = spdlog::stdout_color_mt(kLoggerName);
    console->set_pattern(kConsolePattern);
    console->set_level(spdlog::level::info);
    return console;
}

} // namespace fence
