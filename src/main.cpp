#include "Config.hpp"
#include "ErrorHandler.hpp"
#include "ResourcePool.hpp"
#include "StatusReport.hpp"
#include "SQLiteBackend.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <iostream>
#include <csignal>
#include <signal.h>
#include <memory>
#include <string>
#include <vector>

using namespace respool;

namespace {

volatile std::sig_atomic_t g_signal_received = 0;

void signalHandler(int signal) {
    g_signal_received = signal;
}

// No SA_RESTART: a signal interrupts the blocking stdin read
void setupSignalHandlers() {
    struct sigaction action{};
    action.sa_handler = signalHandler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

spdlog::level::level_enum logLevel(const Config& config) {
    if (config.debug) {
        return spdlog::level::debug;
    }
    auto level = spdlog::level::from_str(config.logging.level);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && config.logging.level != "off") {
        return spdlog::level::info;
    }
    return level;
}

void setupLogging(const Config& config) {
    const auto level = logLevel(config);
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Diagnostics go to stderr so stdout only carries command results
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(level);
        sinks.push_back(console_sink);

        if (config.logging.to_file) {
            try {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                    config.logging.file, false);
                file_sink->set_level(level);
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& ex) {
                std::cerr << "Cannot open log file " << config.logging.file
                          << ": " << ex.what() << std::endl;
            }
        }

        auto logger = std::make_shared<spdlog::logger>("respool", sinks.begin(), sinks.end());
        logger->set_level(level);

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void printHelp() {
    std::cout << "Commands:\n";
    std::cout << "  <operation> [params]   Run one command on a pooled resource\n";
    std::cout << "  status                 Print the pool status as JSON\n";
    std::cout << "  help                   Show this help\n";
    std::cout << "  quit, exit             Close the pool and exit\n";
    std::cout << std::endl;
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

void runCommand(ResourcePool& pool, const Config& config, const std::string& line) {
    auto space = line.find_first_of(" \t");
    std::string operation = line.substr(0, space);
    std::string params = space == std::string::npos ? "" : trim(line.substr(space + 1));

    try {
        std::string result = ErrorHandler::executeWithRetry(
            [&] { return pool.executeCommand(operation, params); },
            config.command_retries);
        std::cout << result << std::endl;
    } catch (const PoolException& e) {
        std::cout << "error: " << ErrorHandler::errorName(e.code())
                  << ": " << e.what() << std::endl;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse configuration
    Config config;
    try {
        config = Config::parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    // Setup logging
    setupLogging(config);

    // Validate configuration
    if (!config.validate()) {
        return 1;
    }

    setupSignalHandlers();

    spdlog::info("Starting respool with {} backend on {}",
                 config.backend_type, config.pool.connection_string);

    auto logger = spdlog::default_logger();
    std::unique_ptr<ResourcePool> pool;
    try {
        pool = std::make_unique<ResourcePool>(
            config.pool, std::make_shared<SQLiteBackend>(logger), logger);
    } catch (const PoolException& e) {
        spdlog::error("Failed to start resource pool ({}): {}",
                      ErrorHandler::errorName(e.code()), e.what());
        return 1;
    }

    std::string line;
    while (!g_signal_received && std::getline(std::cin, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line == "quit" || line == "exit") {
            break;
        }
        if (line == "help") {
            printHelp();
            continue;
        }
        if (line == "status") {
            std::cout << statusToJson(pool->status()).dump(2) << std::endl;
            continue;
        }

        runCommand(*pool, config, line);
    }

    if (g_signal_received) {
        spdlog::info("Received signal {}, shutting down", g_signal_received);
    }

    pool->close();

    spdlog::info("respool stopped");

    return 0;
}
