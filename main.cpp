// Detection
#include "detect/FileValidator.hpp"
#include "detect/SignatureTable.hpp"
#include "evidence/OwnerResolver.hpp"

// Services
#include "services/WatchService.hpp"
#include "core/Scanner.hpp"

// Misc
#include "config/Config.hpp"
#include "config/util.hpp"
#include "logging/EventSink.hpp"
#include "logging/LogRegistry.hpp"

// Libraries
#include <atomic>
#include <csignal>
#include <iostream>
#include <thread>
#include <nlohmann/json.hpp>

using namespace fv::config;
using namespace fv::detect;
using namespace fv::logging;
using namespace fv::services;

namespace fs = std::filesystem;

namespace {
constexpr auto* DEFAULT_CONFIG_PATH = "/etc/file-validator/config.yaml";
constexpr auto* VERSION = "1.1.0";

std::atomic shouldExit = false;

void signalHandler(const int) {
    shouldExit = true;
}

bool stopRequested() {
    return shouldExit.load();
}

struct Options {
    fs::path config_path = DEFAULT_CONFIG_PATH;
    std::vector<fs::path> scan_paths;
    bool scan = false;
};

void printUsage() {
    std::cout << "Usage: file-validator [--config PATH] [--scan PATH...]\n"
              << "  --config PATH   configuration file (default " << DEFAULT_CONFIG_PATH << ")\n"
              << "  --scan PATH...  inspect the given files or directories once and exit\n"
              << "  --version       print the version and exit\n";
}

Options parseArgs(const int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) throw std::invalid_argument("--config requires a path");
            opts.config_path = argv[++i];
        } else if (arg == "--scan") {
            opts.scan = true;
            while (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) opts.scan_paths.emplace_back(argv[++i]);
            if (opts.scan_paths.empty()) throw std::invalid_argument("--scan requires at least one path");
        } else {
            throw std::invalid_argument("unknown argument: " + arg);
        }
    }
    return opts;
}

void printBanner(const Config& cfg, const SignatureTable& table) {
    const auto log = LogRegistry::validator();
    log->info("[*] File Validator {} starting", VERSION);
    log->info("    Signatures:   {} content types", table.signatures().size());
    log->info("    Watching:     {} path(s){}", cfg.monitoring.watch_paths.size(), cfg.monitoring.recursive ? ", recursive" : "");
    for (const auto& p : cfg.monitoring.watch_paths) log->info("      - {}", p.string());
    log->info("    Quarantine:   {}", cfg.quarantine.enabled
                                          ? to_string(cfg.quarantine.mode) + " -> " + cfg.quarantine.path.string()
                                          : std::string("disabled"));
    log->info("    Hashing:      {}", cfg.detection.calculate_hash ? "sha256" : "disabled");
    log->info("    Owner lookup: {}", cfg.detection.get_file_owner ? "enabled" : "disabled");
    log->info("    Max size:     {}", bytesToMbOrGbStr(cfg.detection.max_file_size_bytes));
    if (cfg.detection.escalate_unknown) log->info("    Unknown content on known extensions is escalated");
    log->info("    Logs:         {}", cfg.logging.log_dir.string());
}
}

int main(const int argc, char** argv) {
    Options opts;
    Config cfg;

    try {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") { printUsage(); return EXIT_SUCCESS; }
            if (arg == "--version") { std::cout << "file-validator " << VERSION << std::endl; return EXIT_SUCCESS; }
        }

        opts = parseArgs(argc, argv);
        cfg = loadConfig(opts.config_path);
        cfg.validate();
    } catch (const std::exception& e) {
        std::cerr << "[-] file-validator: " << e.what() << std::endl;
        printUsage();
        return EXIT_FAILURE;
    }

    try {
        LogRegistry::init(cfg.logging);

        const auto table = SignatureTable::builtin();
        const auto sink = std::make_shared<SpdlogEventSink>(cfg.logging.log_dir / "events.json", cfg.logging.console_output);
        FileValidator validator(cfg, table, sink, fv::evidence::makeOwnerResolver(cfg.detection));

        printBanner(cfg, table);
        sink->emit(SecurityEvent(event_type::SYSTEM_START, Severity::Info, {
            {"version", VERSION},
            {"mode", opts.scan ? "scan" : "watch"},
            {"config", cfg}
        }));

        if (auto* q = validator.quarantineManager()) q->sweepStaleStaging();

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        if (opts.scan) {
            const auto summary = fv::core::Scanner(validator, cfg.monitoring.recursive, stopRequested).scan(opts.scan_paths);
            sink->emit(SecurityEvent(event_type::SYSTEM_STOP, Severity::Info, {
                {"mode", "scan"},
                {"reason", summary.interrupted ? "signal" : "complete"},
                {"files", summary.files},
                {"mismatches", summary.mismatches},
                {"failed", summary.failed},
                {"quarantined", summary.quarantined}
            }));
            LogRegistry::shutdown();
            return summary.exitStatus();
        }

        if (cfg.monitoring.scan_existing_on_start)
            fv::core::Scanner(validator, cfg.monitoring.recursive, stopRequested).scan(cfg.monitoring.watch_paths);

        if (shouldExit) {
            sink->emit(SecurityEvent(event_type::SYSTEM_STOP, Severity::Info, {
                {"mode", "watch"},
                {"reason", "signal"}
            }));
            LogRegistry::shutdown();
            return EXIT_SUCCESS;
        }

        WatchService watcher(cfg.monitoring, [&validator](const fv::types::FileEvent& event) {
            validator.handle(event);
        });
        watcher.start();

        LogRegistry::validator()->info("[*] Monitoring active. Press Ctrl+C to stop.");

        while (!shouldExit && watcher.isRunning()) std::this_thread::sleep_for(std::chrono::seconds(1));

        LogRegistry::validator()->info("[*] Shutting down...");
        const bool watcherFailed = !watcher.isRunning() && !shouldExit;
        watcher.stop();

        sink->emit(SecurityEvent(event_type::SYSTEM_STOP, Severity::Info, {
            {"mode", "watch"},
            {"reason", watcherFailed ? "watcher stopped" : "signal"}
        }));

        LogRegistry::validator()->info("[✓] File Validator stopped cleanly.");
        LogRegistry::shutdown();

        return watcherFailed ? EXIT_FAILURE : EXIT_SUCCESS;
    } catch (const std::exception& e) {
        if (LogRegistry::isInitialized()) LogRegistry::validator()->error("[-] File Validator failed: {}", e.what());
        else std::cerr << "[-] File Validator failed: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
