#include "Config.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <cstdlib>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace respool {

namespace {

constexpr int kDefaultMinPoolSize = 1;
constexpr int kDefaultMaxPoolSize = 1;
constexpr std::chrono::milliseconds kDefaultIdleTimeout{5 * 60 * 1000};
constexpr std::chrono::milliseconds kDefaultWaitConnTimeout{10 * 1000};
constexpr std::chrono::milliseconds kDefaultCleanupIdleInterval{60 * 1000};
constexpr std::chrono::milliseconds kDefaultWorkerCloseTimeout{30 * 1000};
constexpr std::chrono::milliseconds kDefaultSubmitTimeout{30 * 1000};
constexpr size_t kDefaultCommandQueueCapacity = 100;

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

bool parseBool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes";
}

template<typename Setter>
void applyDuration(const std::string& key, const std::string& value, Setter&& set) {
    auto parsed = parseDuration(value);
    if (!parsed) {
        spdlog::warn("Ignoring invalid duration for '{}': {}", key, value);
        return;
    }
    set(*parsed);
}

template<typename Setter>
void applyInt(const std::string& key, const std::string& value, Setter&& set) {
    try {
        set(std::stoi(value));
    } catch (const std::exception&) {
        spdlog::warn("Ignoring invalid number for '{}': {}", key, value);
    }
}

}  // namespace

std::optional<std::chrono::milliseconds> parseDuration(const std::string& text) {
    std::string value = trim(text);
    if (value.empty()) {
        return std::nullopt;
    }

    size_t pos = 0;
    double amount = 0;
    try {
        amount = std::stod(value, &pos);
    } catch (const std::exception&) {
        return std::nullopt;
    }

    std::string unit = trim(value.substr(pos));
    std::transform(unit.begin(), unit.end(), unit.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    double millis = 0;
    if (unit.empty() || unit == "s") {
        millis = amount * 1000.0;
    } else if (unit == "ms") {
        millis = amount;
    } else if (unit == "m") {
        millis = amount * 60.0 * 1000.0;
    } else if (unit == "h") {
        millis = amount * 3600.0 * 1000.0;
    } else {
        return std::nullopt;
    }

    // nan, inf and anything past the int64 range cannot be converted
    if (!std::isfinite(millis) || millis < 0 ||
        millis >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
        return std::nullopt;
    }

    return std::chrono::milliseconds(static_cast<int64_t>(millis));
}

void PoolConfig::normalize() {
    if (max_pool_size <= 0) {
        max_pool_size = kDefaultMaxPoolSize;
    }
    if (min_pool_size <= 0) {
        min_pool_size = kDefaultMinPoolSize;
    }
    if (min_pool_size > max_pool_size) {
        min_pool_size = max_pool_size;
    }
    if (idle_timeout.count() <= 0) {
        idle_timeout = kDefaultIdleTimeout;
    }
    if (wait_conn_timeout.count() <= 0) {
        wait_conn_timeout = kDefaultWaitConnTimeout;
    }
    if (cleanup_idle_interval.count() <= 0) {
        cleanup_idle_interval = kDefaultCleanupIdleInterval;
    }
    if (worker_close_timeout.count() <= 0) {
        worker_close_timeout = kDefaultWorkerCloseTimeout;
    }
    if (submit_timeout.count() <= 0) {
        submit_timeout = kDefaultSubmitTimeout;
    }
    if (command_queue_capacity == 0) {
        command_queue_capacity = kDefaultCommandQueueCapacity;
    }
}

std::optional<Config> Config::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;
    std::string current_section;

    while (std::getline(file, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = line.substr(1, line.size() - 2);
            continue;
        }

        // Key-value pair
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        PoolConfig& pool = config.pool;
        if (current_section == "pool") {
            if (key == "min_pool_size")
                applyInt(key, value, [&](int v) { pool.min_pool_size = v; });
            else if (key == "max_pool_size")
                applyInt(key, value, [&](int v) { pool.max_pool_size = v; });
            else if (key == "idle_timeout")
                applyDuration(key, value, [&](auto d) { pool.idle_timeout = d; });
            else if (key == "wait_conn_timeout")
                applyDuration(key, value, [&](auto d) { pool.wait_conn_timeout = d; });
            else if (key == "cleanup_idle_interval")
                applyDuration(key, value, [&](auto d) { pool.cleanup_idle_interval = d; });
            else if (key == "worker_close_timeout")
                applyDuration(key, value, [&](auto d) { pool.worker_close_timeout = d; });
            else if (key == "submit_timeout")
                applyDuration(key, value, [&](auto d) { pool.submit_timeout = d; });
            else if (key == "command_queue_capacity")
                applyInt(key, value, [&](int v) {
                    pool.command_queue_capacity = v > 0 ? static_cast<size_t>(v) : 0;
                });
        }
        else if (current_section == "backend") {
            if (key == "type") config.backend_type = value;
            else if (key == "connection_string") pool.connection_string = value;
            else if (key == "entry_point") pool.entry_point = value;
        }
        else if (current_section == "logging") {
            if (key == "level") config.logging.level = value;
            else if (key == "file") config.logging.file = value;
            else if (key == "to_file") config.logging.to_file = parseBool(value);
            else if (key == "debug") config.debug = parseBool(value);
        }
        else if (current_section == "client") {
            if (key == "command_retries")
                applyInt(key, value, [&](int v) { config.command_retries = v; });
        }
    }

    return config;
}

Config Config::parseArgs(int argc, char* argv[]) {
    Config config;

    CLI::App app{"respool - pool of single-thread-bound backend resources"};

    std::string config_file;
    app.add_option("-c,--config", config_file, "Path to configuration file");

    std::string backend_type;
    auto* typeOpt = app.add_option("-t,--type", backend_type, "Backend type (sqlite)");

    std::string connection;
    auto* connOpt = app.add_option("-C,--connection", connection,
                                   "Backend connection string (SQLite: database file)");
    std::string entry_point;
    auto* entryOpt = app.add_option("-e,--entry-point", entry_point,
                                    "Backend entry point (SQLite: command table)");

    int min_size = 0;
    auto* minOpt = app.add_option("--min", min_size, "Minimum pool size");
    int max_size = 0;
    auto* maxOpt = app.add_option("--max", max_size, "Maximum pool size");

    std::string idle_timeout;
    auto* idleOpt = app.add_option("--idle-timeout", idle_timeout,
                                   "Idle time before a resource is reaped (e.g. 5m)");
    std::string wait_timeout;
    auto* waitOpt = app.add_option("--wait-timeout", wait_timeout,
                                   "Time to wait for a free resource (e.g. 10s)");
    std::string cleanup_interval;
    auto* cleanupOpt = app.add_option("--cleanup-interval", cleanup_interval,
                                      "Idle sweep interval (e.g. 60s)");
    std::string close_timeout;
    auto* closeOpt = app.add_option("--close-timeout", close_timeout,
                                    "Worker shutdown grace period (e.g. 30s)");

    int retries = 0;
    auto* retriesOpt = app.add_option("--retries", retries,
                                      "Retries for commands that hit a busy pool");

    std::string log_file;
    auto* logFileOpt = app.add_option("-l,--log-file", log_file, "Also log to this file");
    std::string log_level;
    auto* levelOpt = app.add_option("--log-level", log_level,
                                    "Log level (trace, debug, info, warn, error)");
    bool debug = false;
    app.add_flag("-d,--debug", debug, "Enable debug output");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    // File values first, explicit command line values override them
    if (!config_file.empty()) {
        auto file_config = loadFromFile(config_file);
        if (file_config) {
            config = *file_config;
        } else {
            spdlog::warn("Could not load config file: {}", config_file);
        }
    }

    if (typeOpt->count() > 0) config.backend_type = backend_type;
    if (connOpt->count() > 0) config.pool.connection_string = connection;
    if (entryOpt->count() > 0) config.pool.entry_point = entry_point;
    if (minOpt->count() > 0) config.pool.min_pool_size = min_size;
    if (maxOpt->count() > 0) config.pool.max_pool_size = max_size;
    if (retriesOpt->count() > 0) config.command_retries = retries;

    auto overrideDuration = [](CLI::Option* opt, const std::string& text,
                               std::chrono::milliseconds& target) {
        if (opt->count() == 0) return;
        auto parsed = parseDuration(text);
        if (!parsed) {
            throw std::invalid_argument("invalid duration for " + opt->get_name() + ": " + text);
        }
        target = *parsed;
    };
    overrideDuration(idleOpt, idle_timeout, config.pool.idle_timeout);
    overrideDuration(waitOpt, wait_timeout, config.pool.wait_conn_timeout);
    overrideDuration(cleanupOpt, cleanup_interval, config.pool.cleanup_idle_interval);
    overrideDuration(closeOpt, close_timeout, config.pool.worker_close_timeout);

    if (logFileOpt->count() > 0) {
        config.logging.file = log_file;
        config.logging.to_file = true;
    }
    if (levelOpt->count() > 0) config.logging.level = log_level;
    if (debug) config.debug = true;

    return config;
}

bool Config::validate() const {
    if (backend_type != "sqlite" && backend_type != "sqlite3") {
        spdlog::error("Unknown backend type: {}", backend_type);
        return false;
    }

    if (pool.connection_string.empty()) {
        spdlog::error("Backend connection string is required (use -C option)");
        return false;
    }

    if (pool.entry_point.empty()) {
        spdlog::error("Backend entry point must not be empty");
        return false;
    }

    if (command_retries < 0 || command_retries > kMaxCommandRetries) {
        spdlog::error("Command retries must be between 0 and {}: {}",
                      kMaxCommandRetries, command_retries);
        return false;
    }

    if (logging.to_file && logging.file.empty()) {
        spdlog::error("Logging to file requested but no log file given");
        return false;
    }

    return true;
}

}  // namespace respool
