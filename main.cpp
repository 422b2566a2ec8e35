#include "core/CancellationToken.hpp"
#include "core/Config.hpp"
#include "core/EventBus.hpp"
#include "core/Logger.hpp"
#include "engine/ControlLoop.hpp"
#include "engine/DecisionEngine.hpp"
#include "response/ViolationJournal.hpp"
#include "source/ReplayEventSource.hpp"
#ifdef EBPFENCE_WITH_LIBBPF
#include "source/BpfEventSource.hpp"
#endif

#include <boost/program_options.hpp>
#include <fmt/ranges.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

namespace fence {

std::atomic<bool> g_running{true};

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = false;
    }
}

class Ebpfence {
public:
    explicit Ebpfence(FenceConfig config) : config_(std::move(config)) {}

    ~Ebpfence() {
        cancel_.Cancel();
        if (loop_thread_.joinable()) {
            loop_thread_.join();
        }
    }

    bool Initialize() {
        LOG_INFO("Initializing ebpfence...");

        if (!config_.replay_path.empty()) {
            std::vector<AccessEvent> events;
            try {
                events = ReplayEventSource::LoadEventsFromFile(config_.replay_path);
            } catch (const std::exception& ex) {
                LOG_ERROR("Failed to load replay events: {}", ex.what());
                return false;
            }
            replay_event_count_ = events.size();
            replay_mode_ = true;
            source_ = std::make_unique<ReplayEventSource>(std::move(events));
            LOG_INFO("Replay mode: no kernel enforcement, blocks are recorded only");
        } else {
#ifdef EBPFENCE_WITH_LIBBPF
            auto bpf_source = std::make_unique<BpfEventSource>();
            ActionResult opened = bpf_source->Open(config_.bpf_object);
            if (!opened.success) {
                LOG_ERROR("Failed to start eBPF capture: {}", opened.error_message);
                return false;
            }
            source_ = std::move(bpf_source);
#else
            LOG_ERROR("This build has no libbpf support; use --replay to run against recorded events");
            return false;
#endif
        }

        // One worker keeps journal records in decision order.
        bus_.InitAsyncPool(1);

        if (!config_.journal_path.empty()) {
            journal_ = std::make_unique<ViolationJournal>();
            if (!journal_->Initialize(config_.journal_path, &bus_)) {
                LOG_WARN("Failed to initialize violation journal, continuing without it");
                journal_.reset();
            }
        }

        try {
            engine_ = std::make_unique<DecisionEngine>(config_.policy, *source_, &bus_);
        } catch (const std::invalid_argument& ex) {
            LOG_ERROR("Invalid policy: {}", ex.what());
            return false;
        }
        loop_ = std::make_unique<ControlLoop>(*source_, *engine_);

        return true;
    }

    void Start() {
        if (journal_) {
            journal_->Start();
        }

        loop_thread_ = std::thread([this]() {
            ActionResult result = loop_->Run(cancel_);
            if (!result.success) {
                LOG_ERROR("Control loop failed: {}", result.error_message);
            }
        });
    }

    void Run() {
        LOG_INFO("ebpfence is now running. Press Ctrl+C to stop.");

        auto last_status = std::chrono::steady_clock::now();

        while (g_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));

            // A replay has a known end; stop once every event went through the engine.
            if (replay_mode_ && loop_->GetEventsProcessed() >= replay_event_count_) {
                LOG_INFO("Replay finished");
                break;
            }

            auto now = std::chrono::steady_clock::now();
            if (now - last_status >= std::chrono::seconds(10)) {
                LOG_INFO("Status: events={}, violations={}, blocked={}, read_errors={}",
                         loop_->GetEventsProcessed(), engine_->GetViolationCount(),
                         engine_->GetBlockedPids().size(), loop_->GetReadErrors());
                last_status = now;
            }
        }
    }

    void Stop() {
        LOG_INFO("Exiting...");

        cancel_.Cancel();
        if (loop_thread_.joinable()) {
            loop_thread_.join();
        }

        if (journal_) {
            journal_->Stop();
        }

        if (source_) {
            ActionResult closed = source_->Close();
            if (!closed.success) {
                LOG_ERROR("Failed to close event source: {}", closed.error_message);
            }
        }

        bus_.ShutdownAsyncPool();

        if (engine_) {
            std::vector<uint32_t> blocked = engine_->GetBlockedPids();
            std::sort(blocked.begin(), blocked.end());
            LOG_INFO("Session summary: {} violation(s) across {} process(es), blocked PIDs: [{}]",
                     engine_->GetViolationCount(), engine_->GetTrackedPidCount(),
                     fmt::join(blocked, ", "));
        }
    }

private:
    FenceConfig config_;
    CancellationToken cancel_;
    EventBus bus_;
    std::unique_ptr<EventSource> source_;
    std::unique_ptr<ViolationJournal> journal_;
    std::unique_ptr<DecisionEngine> engine_;
    std::unique_ptr<ControlLoop> loop_;
    std::thread loop_thread_;

    bool replay_mode_{false};
    size_t replay_event_count_{0};
};

} // namespace fence

int main(int argc, char* argv[]) {
    namespace po = boost::program_options;

    fence::FenceConfig config;
    std::string config_file;
    std::string disallowed;
    std::string log_level;

    po::options_description generic("Generic options");
    generic.add_options()
        ("help,h", "produces help message")
        ("config,c", po::value<std::string>(&config_file),
            "YAML configuration file; command line values override it")
        ;

    po::options_description options("Policy");
    options.add_options()
        ("disallowed,d", po::value<std::string>(&disallowed),
            "comma-separated list of disallowed file patterns (e.g. '/etc/passwd,/etc/shadow')")
        ("threshold,t", po::value<uint32_t>(),
            "number of disallowed files before blocking (default: 2)")
        ("pid,p", po::value<uint32_t>(),
            "PID to monitor (default: 0, which monitors all processes)")
        ;

    po::options_description runtime("Runtime");
    runtime.add_options()
        ("bpf-object", po::value<std::string>(), "path to the compiled eBPF object")
        ("replay", po::value<std::string>(), "replay JSON-lines events instead of attaching to the kernel")
        ("journal", po::value<std::string>(), "append violations to this JSON-lines file")
        ("log-file", po::value<std::string>(), "rotating log file (empty for console only)")
        ("log-level", po::value<std::string>(&log_level), "trace|debug|info|warn|error|critical")
        ;

    po::options_description cmdline_options;
    cmdline_options.add(generic).add(options).add(runtime);

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, cmdline_options), vm);
        po::notify(vm);

        if (vm.count("help")) {
            std::cout << "Usage: sudo ebpfence --disallowed <patterns> [options]\n"
                      << cmdline_options << std::endl;
            return 0;
        }

        if (vm.count("config")) {
            fence::LoadConfigFile(config_file, config);
        }

        if (vm.count("disallowed")) config.policy.disallowed_patterns = fence::ParsePatternList(disallowed);
        if (vm.count("threshold"))  config.policy.threshold = vm["threshold"].as<uint32_t>();
        if (vm.count("pid"))        config.policy.target_pid = vm["pid"].as<uint32_t>();
        if (vm.count("bpf-object")) config.bpf_object = vm["bpf-object"].as<std::string>();
        if (vm.count("replay"))     config.replay_path = vm["replay"].as<std::string>();
        if (vm.count("journal"))    config.journal_path = vm["journal"].as<std::string>();
        if (vm.count("log-file"))   config.logging.file = vm["log-file"].as<std::string>();
        if (vm.count("log-level") && !fence::ParseLogLevel(log_level, config.logging.level)) {
            throw fence::ConfigError("unknown log level '" + log_level + "'");
        }

        fence::ValidateConfig(config);
    } catch (const std::exception& ex) {
        std::cerr << "ebpfence: " << ex.what() << "\n" << cmdline_options << std::endl;
        return 1;
    }

    try {
        fence::Logger::Initialize(config.logging.file);
    } catch (const std::exception&) {
        // Initialize() already reported the reason on stderr.
        return 1;
    }
    fence::Logger::SetLevel(config.logging.level);

    std::signal(SIGINT, fence::SignalHandler);
    std::signal(SIGTERM, fence::SignalHandler);

    try {
        fence::Ebpfence app(config);

        if (!app.Initialize()) {
            LOG_CRITICAL("Failed to initialize ebpfence");
            fence::Logger::Shutdown();
            return 1;
        }

        app.Start();
        app.Run();
        app.Stop();

        LOG_INFO("ebpfence shutdown complete");
        fence::Logger::Shutdown();
        return 0;
    } catch (const std::exception& ex) {
        LOG_CRITICAL("Fatal error: {}", ex.what());
        fence::Logger::Shutdown();
        return 1;
    }
}
