#pragma once

/**
 * @file SQLiteBackend.hpp
 * @brief Resource backend serving commands from an SQLite database.
 *
 * Each resource is one SQLite connection opened in multi-thread mode
 * (SQLITE_OPEN_NOMUTEX): SQLite performs no locking of its own for the
 * connection, so it must only be used from one thread at a time, which the
 * pool's worker guarantees.
 */

#include "ResourceBackend.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace respool {

/**
 * @class SQLiteException
 * @brief Error reported by SQLite or by the command layer on top of it.
 */
class SQLiteException : public std::runtime_error {
public:
    SQLiteException(int errorCode, const std::string& message);

    int errorCode() const { return m_errorCode; }

private:
    int m_errorCode;
};

/**
 * @class SQLiteHandle
 * @brief One initialized SQLite connection with its prepared commands.
 *
 * Initialization sequence:
 * 1. Open the database file named by the connection string (it must exist).
 * 2. Check that the entry point table or view exists.
 * 3. Read its (name, statement) rows and prepare every statement.
 *
 * A failure at any step releases whatever was acquired so far and throws
 * SQLiteException.
 *
 * Commands:
 * - The operation selects a prepared statement by name.
 * - The params payload is JSON: an object binds named parameters
 *   (:key, @key or $key), an array binds positional parameters, a scalar
 *   binds the first parameter, and an empty payload binds nothing.
 * - Statements returning columns produce a JSON array of row objects;
 *   other statements produce the number of changed rows.
 *
 * Usage:
 * @code
 *   -- entry point table
 *   CREATE TABLE commands (name TEXT PRIMARY KEY, statement TEXT NOT NULL);
 *   INSERT INTO commands VALUES ('get_item', 'SELECT * FROM items WHERE id = :id');
 *
 *   handle.execute({"get_item", R"({"id": 7})"});   // "[{\"id\":7,...}]"
 * @endcode
 */
class SQLiteHandle : public ResourceHandle {
public:
    /**
     * @brief Open the database and prepare the entry point's commands.
     * @param dbPath Path to an existing SQLite database file.
     * @param entryPoint Name of the table or view listing the commands.
     * @param logger Logger for initialization and teardown messages.
     * @throws SQLiteException if any initialization step fails.
     */
    SQLiteHandle(const std::string& dbPath,
                 const std::string& entryPoint,
                 std::shared_ptr<spdlog::logger> logger);

    /**
     * @brief Destructor - releases the connection if release() was not called.
     */
    ~SQLiteHandle() override;

    ResultPayload execute(const Command& command) override;

    /**
     * @brief Finalize statements in reverse preparation order, then close
     *        the connection. Safe to call more than once.
     */
    void release() override;

    size_t commandCount() const { return m_statements.size(); }
    bool hasCommand(const std::string& name) const;

private:
    void open();
    void verifyEntryPoint();
    void prepareCommands();

    sqlite3_stmt* findStatement(const std::string& name) const;
    void bindParams(sqlite3_stmt* stmt, const std::string& params);

    [[noreturn]] void fail(const std::string& context) const;

    sqlite3* m_db = nullptr;                  ///< SQLite database handle
    std::string m_path;                       ///< Path to database file
    std::string m_entryPoint;                 ///< Command table
    std::shared_ptr<spdlog::logger> m_logger;

    /// Prepared commands, in preparation order
    std::vector<std::pair<std::string, sqlite3_stmt*>> m_statements;
};

/**
 * @class SQLiteBackend
 * @brief Creates SQLiteHandle resources from the pool configuration.
 *
 * connection_string is the database file, entry_point the command table.
 */
class SQLiteBackend : public ResourceBackend {
public:
    explicit SQLiteBackend(std::shared_ptr<spdlog::logger> logger = nullptr);

    std::string name() const override { return "sqlite"; }

    std::unique_ptr<ResourceHandle> initialize(const PoolConfig& config) override;

private:
    std::shared_ptr<spdlog::logger> m_logger;
};

}  // namespace respool
