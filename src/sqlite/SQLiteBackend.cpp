/**
 * @file SQLiteBackend.cpp
 * @brief Implementation of the SQLite resource backend.
 */

#include "SQLiteBackend.hpp"
#include "Config.hpp"
#include "ErrorHandler.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <array>

namespace respool {

using json = nlohmann::json;

namespace {

std::string quoteIdentifier(const std::string& name) {
    std::string quoted = "\"";
    for (char c : name) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string toHex(const void* data, int size) {
    static const char digits[] = "0123456789abcdef";
    const auto* bytes = static_cast<const unsigned char*>(data);
    std::string out;
    out.reserve(static_cast<size_t>(size) * 2);
    for (int i = 0; i < size; ++i) {
        out += digits[bytes[i] >> 4];
        out += digits[bytes[i] & 0x0F];
    }
    return out;
}

json columnValue(sqlite3_stmt* stmt, int index) {
    switch (sqlite3_column_type(stmt, index)) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT: {
            const unsigned char* text = sqlite3_column_text(stmt, index);
            return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
        }
        case SQLITE_BLOB:
            return toHex(sqlite3_column_blob(stmt, index), sqlite3_column_bytes(stmt, index));
        case SQLITE_NULL:
        default:
            return nullptr;
    }
}

int bindValue(sqlite3_stmt* stmt, int index, const json& value) {
    switch (value.type()) {
        case json::value_t::null:
            return sqlite3_bind_null(stmt, index);
        case json::value_t::boolean:
            return sqlite3_bind_int(stmt, index, value.get<bool>() ? 1 : 0);
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
            return sqlite3_bind_int64(stmt, index, value.get<int64_t>());
        case json::value_t::number_float:
            return sqlite3_bind_double(stmt, index, value.get<double>());
        case json::value_t::string: {
            const auto& text = value.get_ref<const std::string&>();
            return sqlite3_bind_text(stmt, index, text.c_str(),
                                     static_cast<int>(text.size()), SQLITE_TRANSIENT);
        }
        default: {
            // Nested objects/arrays are bound as their JSON text
            std::string text = value.dump();
            return sqlite3_bind_text(stmt, index, text.c_str(),
                                     static_cast<int>(text.size()), SQLITE_TRANSIENT);
        }
    }
}

}  // namespace

SQLiteException::SQLiteException(int errorCode, const std::string& message)
    : std::runtime_error(message), m_errorCode(errorCode) {
}

// ============================================================================
// Construction and Destruction
// ============================================================================

SQLiteHandle::SQLiteHandle(const std::string& dbPath,
                           const std::string& entryPoint,
                           std::shared_ptr<spdlog::logger> logger)
    : m_path(dbPath),
      m_entryPoint(entryPoint),
      m_logger(logger ? std::move(logger) : spdlog::default_logger()) {
    try {
        open();
        verifyEntryPoint();
        prepareCommands();
    } catch (const SQLiteException&) {
        release();
        throw;
    }

    m_logger->debug("SQLite handle on '{}' ready with {} commands from '{}'",
                    m_path, m_statements.size(), m_entryPoint);
}

SQLiteHandle::~SQLiteHandle() {
    release();
}

// ============================================================================
// Initialization Sequence
// ============================================================================

void SQLiteHandle::open() {
    int rc = sqlite3_open_v2(m_path.c_str(), &m_db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_NOMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string message = m_db ? sqlite3_errmsg(m_db) : "unknown error";
        if (m_db) {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
        throw SQLiteException(rc, "failed to open SQLite database '" + m_path + "': " + message);
    }

    // Other pooled connections may hold the write lock briefly
    sqlite3_busy_timeout(m_db, 5000);
}

void SQLiteHandle::verifyEntryPoint() {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db,
            "SELECT count(*) FROM sqlite_master WHERE type IN ('table', 'view') AND name = ?1",
            -1, &stmt, nullptr) != SQLITE_OK) {
        fail("entry point lookup");
    }

    sqlite3_bind_text(stmt, 1, m_entryPoint.c_str(), -1, SQLITE_TRANSIENT);
    bool found = sqlite3_step(stmt) == SQLITE_ROW && sqlite3_column_int(stmt, 0) > 0;
    sqlite3_finalize(stmt);

    if (!found) {
        throw SQLiteException(SQLITE_NOTFOUND,
                              "entry point '" + m_entryPoint + "' not found in '" + m_path + "'");
    }
}

void SQLiteHandle::prepareCommands() {
    std::string sql = "SELECT name, statement FROM " + quoteIdentifier(m_entryPoint);

    sqlite3_stmt* listing = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.c_str(), -1, &listing, nullptr) != SQLITE_OK) {
        fail("reading entry point '" + m_entryPoint + "'");
    }

    std::vector<std::pair<std::string, std::string>> definitions;
    int rc;
    while ((rc = sqlite3_step(listing)) == SQLITE_ROW) {
        const unsigned char* name = sqlite3_column_text(listing, 0);
        const unsigned char* statement = sqlite3_column_text(listing, 1);
        if (!name || !statement) {
            continue;
        }
        definitions.emplace_back(reinterpret_cast<const char*>(name),
                                 reinterpret_cast<const char*>(statement));
    }
    sqlite3_finalize(listing);

    if (rc != SQLITE_DONE) {
        fail("reading entry point '" + m_entryPoint + "'");
    }
    if (definitions.empty()) {
        throw SQLiteException(SQLITE_NOTFOUND,
                              "entry point '" + m_entryPoint + "' defines no commands");
    }

    for (const auto& [name, statement] : definitions) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, statement.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
            fail("preparing command '" + name + "'");
        }
        // Empty or comment-only SQL prepares to no statement
        if (!stmt) {
            throw SQLiteException(SQLITE_ERROR,
                                  "preparing command '" + name + "': statement is empty");
        }
        m_statements.emplace_back(name, stmt);
    }
}

// ============================================================================
// Command Execution
// ============================================================================

bool SQLiteHandle::hasCommand(const std::string& name) const {
    return findStatement(name) != nullptr;
}

sqlite3_stmt* SQLiteHandle::findStatement(const std::string& name) const {
    auto it = std::find_if(m_statements.begin(), m_statements.end(),
                           [&name](const auto& entry) { return entry.first == name; });
    return it == m_statements.end() ? nullptr : it->second;
}

ResultPayload SQLiteHandle::execute(const Command& command) {
    if (!m_db) {
        throw SQLiteException(SQLITE_MISUSE, "connection already released");
    }

    sqlite3_stmt* stmt = findStatement(command.operation);
    if (!stmt) {
        throw SQLiteException(SQLITE_NOTFOUND, "unknown command '" + command.operation + "'");
    }

    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    bindParams(stmt, command.params);

    const int columns = sqlite3_column_count(stmt);
    json rows = json::array();

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        json row = json::object();
        for (int i = 0; i < columns; ++i) {
            const char* name = sqlite3_column_name(stmt, i);
            row[name ? name : std::to_string(i)] = columnValue(stmt, i);
        }
        rows.push_back(std::move(row));
    }

    if (rc != SQLITE_DONE) {
        std::string message = sqlite3_errmsg(m_db);
        sqlite3_reset(stmt);
        throw SQLiteException(rc, "command '" + command.operation + "' failed: " + message);
    }
    sqlite3_reset(stmt);

    if (columns == 0) {
        return static_cast<int64_t>(sqlite3_changes(m_db));
    }
    return rows.dump();
}

void SQLiteHandle::bindParams(sqlite3_stmt* stmt, const std::string& params) {
    if (params.find_first_not_of(" \t\r\n") == std::string::npos) {
        return;
    }

    json value = json::parse(params, nullptr, false);
    if (value.is_discarded()) {
        throw SQLiteException(SQLITE_MISUSE, "command parameters are not valid JSON");
    }

    const int expected = sqlite3_bind_parameter_count(stmt);

    if (value.is_object()) {
        static const std::array<const char*, 3> prefixes{":", "@", "$"};
        for (const auto& [key, item] : value.items()) {
            int index = 0;
            for (const char* prefix : prefixes) {
                index = sqlite3_bind_parameter_index(stmt, (prefix + key).c_str());
                if (index > 0) break;
            }
            if (index == 0) {
                throw SQLiteException(SQLITE_RANGE, "no parameter named '" + key + "'");
            }
            if (bindValue(stmt, index, item) != SQLITE_OK) {
                fail("binding parameter '" + key + "'");
            }
        }
    } else if (value.is_array()) {
        if (static_cast<int>(value.size()) > expected) {
            throw SQLiteException(SQLITE_RANGE,
                "too many parameters: got " + std::to_string(value.size()) +
                ", statement takes " + std::to_string(expected));
        }
        for (size_t i = 0; i < value.size(); ++i) {
            if (bindValue(stmt, static_cast<int>(i + 1), value[i]) != SQLITE_OK) {
                fail("binding parameter " + std::to_string(i + 1));
            }
        }
    } else {
        if (expected < 1) {
            throw SQLiteException(SQLITE_RANGE, "statement takes no parameters");
        }
        if (bindValue(stmt, 1, value) != SQLITE_OK) {
            fail("binding parameter 1");
        }
    }
}

// ============================================================================
// Teardown and Errors
// ============================================================================

void SQLiteHandle::release() {
    // Reverse acquisition order: statements first, newest first
    for (auto it = m_statements.rbegin(); it != m_statements.rend(); ++it) {
        sqlite3_finalize(it->second);
    }
    m_statements.clear();

    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
        m_logger->debug("SQLite handle on '{}' released", m_path);
    }
}

void SQLiteHandle::fail(const std::string& context) const {
    int code = m_db ? sqlite3_errcode(m_db) : SQLITE_ERROR;
    std::string message = m_db ? sqlite3_errmsg(m_db) : "no connection";
    throw SQLiteException(code, context + ": " + message);
}

// ============================================================================
// Backend
// ============================================================================

SQLiteBackend::SQLiteBackend(std::shared_ptr<spdlog::logger> logger)
    : m_logger(logger ? std::move(logger) : spdlog::default_logger()) {
}

std::unique_ptr<ResourceHandle> SQLiteBackend::initialize(const PoolConfig& config) {
    if (config.connection_string.empty()) {
        throw PoolException(PoolError::InvalidConfig, "SQLite backend needs a database path");
    }
    return std::make_unique<SQLiteHandle>(config.connection_string, config.entry_point, m_logger);
}

}  // namespace respool
