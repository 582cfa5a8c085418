// STRATA Daemon - Main Entry Point
// Copyright (c) 2024 STRATA Developers
// MIT License
//
// stratad opens (or creates) a chain, imports blocks from hex files and
// then keeps the chain open until it is signalled to stop.

#include "strata/core/hex.h"
#include "strata/node/context.h"
#include "strata/util/config.h"
#include "strata/util/logging.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <fstream>
#include <getopt.h>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

namespace strata {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "STRATA Daemon";

namespace defaults {
    constexpr const char* CONFIG_FILENAME = "strata.conf";
}

// ============================================================================
// Command Line
// ============================================================================

struct DaemonOptions {
    std::string configFile;
    std::vector<std::string> importFiles;
    /// Exit after importing instead of waiting for a signal
    bool oneShot{false};
    /// key=value pairs that override the config file
    std::vector<std::pair<std::string, std::string>> overrides;
};

static std::atomic<bool> g_shutdown{false};
static std::mutex g_shutdownMutex;
static std::condition_variable g_shutdownCondition;

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown.store(true);
        g_shutdownCondition.notify_all();
    }
}

void SetupSignalHandlers() {
    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);
    std::signal(SIGPIPE, SIG_IGN);
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << std::endl;
}

void PrintHelp() {
    PrintVersion();
    std::cout << "\nUsage: stratad [options]\n\n"
              << "Options:\n"
              << "  -h, --help                Show this help\n"
              << "  -v, --version             Show version\n"
              << "  -c, --conf=<file>         Config file (default: <datadir>/" << defaults::CONFIG_FILENAME << ")\n"
              << "  -d, --datadir=<dir>       Data directory\n"
              << "      --regtest             Use the regression test network\n"
              << "      --inmemory            Keep the chain in memory only\n"
              << "      --import=<file>       Submit blocks from a file of hex lines (repeatable)\n"
              << "      --oneshot             Exit after importing\n"
              << "      --debug=<level>       Log level (trace, debug, info, warn, error)\n"
              << std::endl;
}

/// @return false if the program should exit without starting
bool ParseCommandLine(int argc, char* argv[], DaemonOptions& options, int& exitCode) {
    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"conf", required_argument, nullptr, 'c'},
        {"datadir", required_argument, nullptr, 'd'},
        {"regtest", no_argument, nullptr, 1001},
        {"inmemory", no_argument, nullptr, 1002},
        {"import", required_argument, nullptr, 1003},
        {"oneshot", no_argument, nullptr, 1004},
        {"debug", required_argument, nullptr, 1005},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;
    while ((opt = getopt_long(argc, argv, "hvc:d:", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                PrintHelp();
                exitCode = 0;
                return false;
            case 'v':
                PrintVersion();
                exitCode = 0;
                return false;
            case 'c':
                options.configFile = optarg;
                break;
            case 'd':
                options.overrides.emplace_back("datadir", optarg);
                break;
            case 1001:  // --regtest
                options.overrides.emplace_back("network", "regtest");
                break;
            case 1002:  // --inmemory
                options.overrides.emplace_back("inmemory", "1");
                break;
            case 1003:  // --import
                options.importFiles.push_back(optarg);
                break;
            case 1004:  // --oneshot
                options.oneShot = true;
                break;
            case 1005:  // --debug
                options.overrides.emplace_back("debug", optarg);
                break;
            default:
                PrintHelp();
                exitCode = 1;
                return false;
        }
    }
    return true;
}

// ============================================================================
// Block Import
// ============================================================================

struct ImportStats {
    size_t lines{0};
    size_t accepted{0};
    size_t rejected{0};
};

ImportStats ImportBlocks(NodeContext& node, const std::string& path) {
    ImportStats stats;
    std::ifstream file(path);
    if (!file) {
        LOG_ERROR(util::LogCategory::DEFAULT) << "Cannot open import file " << path;
        return stats;
    }

    std::string line;
    while (std::getline(file, line) && !IsShutdownRequested(node)) {
        if (line.empty() || line[0] == '#') {
            continue;
        }
        ++stats.lines;
        if (!IsValidHex(line)) {
            LOG_WARN(util::LogCategory::DEFAULT) << path << ":" << stats.lines << ": not hex";
            ++stats.rejected;
            continue;
        }
        ChainResult result = node.chainman->ProcessBlockBytes(HexToBytes(line));
        if (result.IsSuccess() || result.chain == ChainError::UNKNOWN_ANCESTOR) {
            ++stats.accepted;
        } else {
            LOG_WARN(util::LogCategory::CHAIN) << path << ":" << stats.lines << ": " << result.ToString();
            ++stats.rejected;
        }
        if (node.chainman->IsHalted()) {
            break;
        }
    }
    return stats;
}

// ============================================================================
// Main Application
// ============================================================================

int AppMain(int argc, char* argv[]) {
    DaemonOptions options;
    int exitCode = 0;
    if (!ParseCommandLine(argc, argv, options, exitCode)) {
        return exitCode;
    }

    util::ConfigManager config;
    for (const auto& kv : options.overrides) {
        config.Set(kv.first, kv.second);
    }
    std::string configFile = options.configFile;
    if (configFile.empty() && config.HasKey("datadir")) {
        configFile = config.GetString("datadir", "") + "/" + defaults::CONFIG_FILENAME;
        if (!std::ifstream(configFile)) {
            configFile.clear();
        }
    }
    if (!configFile.empty()) {
        util::ConfigParseResult parsed = config.ParseFile(configFile);
        if (!parsed.success) {
            std::cerr << "Error reading config: " << parsed.ToString() << std::endl;
            return 1;
        }
        // Command line wins over the file
        for (const auto& kv : options.overrides) {
            config.Set(kv.first, kv.second);
        }
    }

    CoreConfig core;
    try {
        core = LoadCoreConfig(config);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    util::InitLogging(MakeLoggingOptions(core));
    LOG_INFO(util::LogCategory::DEFAULT) << CLIENT_NAME << " v" << VERSION << " starting";

    SetupSignalHandlers();

    NodeContext node;
    if (!InitializeNode(node, core)) {
        LOG_ERROR(util::LogCategory::DEFAULT) << "Failed to initialize node";
        util::ShutdownLogging();
        return 1;
    }

    for (const std::string& path : options.importFiles) {
        STRATA_LOG_TIMER(util::LogCategory::BENCH, "import " + path);
        ImportStats stats = ImportBlocks(node, path);
        LOG_INFO(util::LogCategory::DEFAULT) << "Imported " << path << ": " << stats.accepted
                                             << " accepted, " << stats.rejected << " rejected";
    }

    int result = 0;
    if (node.chainman->IsHalted()) {
        LOG_FATAL(util::LogCategory::CHAIN) << "Chain halted on corrupt storage";
        result = 1;
    } else if (!options.oneShot) {
        LOG_INFO(util::LogCategory::DEFAULT) << "Running at height " << node.GetHeight();
        std::unique_lock<std::mutex> lock(g_shutdownMutex);
        while (!g_shutdown.load()) {
            g_shutdownCondition.wait_for(lock, std::chrono::seconds(1));
        }
    }

    LOG_INFO(util::LogCategory::DEFAULT) << "Final height " << node.GetHeight()
                                         << ", mempool " << node.GetMempoolSize() << " transactions";
    ShutdownNode(node);
    util::ShutdownLogging();
    return result;
}

} // namespace strata

int main(int argc, char* argv[]) {
    try {
        return strata::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
