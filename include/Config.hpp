#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <filesystem>
#include <cstddef>

namespace respool {

struct PoolConfig {
    // Backend connection target (for SQLite: path to the database file)
    std::string connection_string;
    // Backend entry point (for SQLite: table holding the command statements)
    std::string entry_point = "commands";

    int min_pool_size = 1;
    int max_pool_size = 1;

    // Timeouts
    std::chrono::milliseconds idle_timeout{300000};
    std::chrono::milliseconds wait_conn_timeout{10000};
    std::chrono::milliseconds cleanup_idle_interval{60000};
    std::chrono::milliseconds worker_close_timeout{30000};
    std::chrono::milliseconds submit_timeout{30000};

    size_t command_queue_capacity = 100;

    // Establish the pool invariants; applied once at pool construction
    void normalize();
};

struct LogConfig {
    std::string level = "info";
    std::string file;
    bool to_file = false;
};

// Upper bound for Config::command_retries
constexpr int kMaxCommandRetries = 10;

struct Config {
    PoolConfig pool;
    LogConfig logging;

    std::string backend_type = "sqlite";
    int command_retries = 0;
    bool debug = false;

    // Load from file
    static std::optional<Config> loadFromFile(const std::filesystem::path& path);

    // Parse command line arguments
    static Config parseArgs(int argc, char* argv[]);

    // Validate configuration
    bool validate() const;
};

// "250ms", "30s", "5m", "1h"; a bare number is seconds
std::optional<std::chrono::milliseconds> parseDuration(const std::string& text);

}  // namespace respool
