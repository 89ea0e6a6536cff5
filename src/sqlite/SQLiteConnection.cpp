/**
 * @file SQLiteConnection.cpp
 * @brief Physical SQLite connection over the sqlite3 C API.
 */

#include "SQLiteConnection.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <memory>

namespace safedb {

namespace {

// Finalizes a prepared statement when it goes out of scope
struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};
using StatementPtr = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

SqlValue columnValue(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return std::nullopt;
    }
    const unsigned char* text = sqlite3_column_text(stmt, col);
    int len = sqlite3_column_bytes(stmt, col);
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(len));
}

}  // namespace

// ============================================================================
// Construction and Destruction
// ============================================================================

SQLiteConnection::SQLiteConnection(const std::string& dbPath, std::chrono::milliseconds busyTimeout)
    : m_path(dbPath)
    , m_busyTimeout(busyTimeout) {
    int rc = sqlite3_open_v2(dbPath.c_str(), &m_db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = m_db ? sqlite3_errmsg(m_db) : "unknown error";
        if (m_db) {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
        throw DriverError("SQLite", rc, "Failed to open '" + dbPath + "': " + msg);
    }

    sqlite3_busy_timeout(m_db, static_cast<int>(m_busyTimeout.count()));
    spdlog::debug("Opened SQLite database '{}'", m_path);
}

SQLiteConnection::~SQLiteConnection() {
    if (!m_db) {
        return;
    }
    if (inactiveDestroy()) {
        spdlog::debug("Leaving SQLite handle for '{}' open", m_path);
        return;
    }
    sqlite3_close_v2(m_db);
}

void SQLiteConnection::close() {
    if (m_db) {
        sqlite3_close_v2(m_db);
        m_db = nullptr;
        spdlog::debug("Closed SQLite database '{}'", m_path);
    }
}

// ============================================================================
// Liveness
// ============================================================================

bool SQLiteConnection::ping() {
    if (!m_db) return false;

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT 1", -1, &raw, nullptr) != SQLITE_OK) {
        return false;
    }
    StatementPtr stmt(raw);
    return sqlite3_step(stmt.get()) == SQLITE_ROW;
}

// ============================================================================
// Query Execution
// ============================================================================

uint64_t SQLiteConnection::execute(const std::string& sql) {
    char* errMsg = nullptr;
    int rc = sqlite3_exec(handle(), sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string msg = errMsg ? errMsg : sqlite3_errmsg(m_db);
        if (errMsg) sqlite3_free(errMsg);
        throw DriverError("SQLite", rc, msg);
    }
    return static_cast<uint64_t>(sqlite3_changes(m_db));
}

ResultSet SQLiteConnection::query(const std::string& sql) {
    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(handle(), sql.c_str(), -1, &raw, nullptr);
    if (rc != SQLITE_OK) {
        fail(rc, "prepare");
    }
    StatementPtr stmt(raw);

    ResultSet result;
    if (!stmt) {
        // Empty statement (whitespace or comment only)
        return result;
    }

    int colCount = sqlite3_column_count(stmt.get());
    for (int i = 0; i < colCount; ++i) {
        const char* name = sqlite3_column_name(stmt.get(), i);
        result.columns.emplace_back(name ? name : "");
    }

    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        std::vector<SqlValue> row;
        row.reserve(static_cast<size_t>(colCount));
        for (int i = 0; i < colCount; ++i) {
            row.push_back(columnValue(stmt.get(), i));
        }
        result.rows.push_back(std::move(row));
    }

    if (rc != SQLITE_DONE) {
        fail(rc, "step");
    }
    return result;
}

// ============================================================================
// Transactions
// ============================================================================

void SQLiteConnection::begin() {
    execute("BEGIN");
}

void SQLiteConnection::commit() {
    execute("COMMIT");
}

void SQLiteConnection::rollback() {
    execute("ROLLBACK");
}

// ============================================================================
// Metadata
// ============================================================================

std::vector<std::string> SQLiteConnection::tables() {
    ResultSet rs = query(
        "SELECT name FROM sqlite_master WHERE type='table' "
        "AND name NOT LIKE 'sqlite_%' ORDER BY name");

    std::vector<std::string> names;
    for (const auto& row : rs.rows) {
        if (!row.empty() && row[0]) {
            names.push_back(*row[0]);
        }
    }
    return names;
}

std::vector<ColumnInfo> SQLiteConnection::columns(const std::string& table) {
    // PRAGMA table_info columns: cid, name, type, notnull, dflt_value, pk
    ResultSet rs = query("PRAGMA table_info(" + quote(table) + ")");

    std::vector<ColumnInfo> result;
    for (const auto& row : rs.rows) {
        if (row.size() < 6) continue;
        ColumnInfo col;
        col.name = row[1].value_or("");
        col.type = row[2].value_or("");
        col.nullable = row[3].value_or("0") == "0";
        col.primary_key = row[5].value_or("0") != "0";
        result.push_back(std::move(col));
    }
    return result;
}

uint64_t SQLiteConnection::lastInsertId() {
    return static_cast<uint64_t>(sqlite3_last_insert_rowid(handle()));
}

std::string SQLiteConnection::quote(const std::string& value) {
    char* quoted = sqlite3_mprintf("%Q", value.c_str());
    if (!quoted) {
        throw DriverError("SQLite", SQLITE_NOMEM, "Out of memory while quoting");
    }
    std::string result(quoted);
    sqlite3_free(quoted);
    return result;
}

// ============================================================================
// Attributes and driver operations
// ============================================================================

SqlValue SQLiteConnection::attribute(const std::string& name) {
    if (name == "Name") return m_path;
    if (name == "Driver") return driverName();
    if (name == "sqlite_version") return std::string(sqlite3_libversion());
    if (name == "busy_timeout") return std::to_string(m_busyTimeout.count());
    return std::nullopt;
}

void SQLiteConnection::setAttribute(const std::string& name, const SqlValue& value) {
    if (name == "busy_timeout" && value) {
        setBusyTimeout(std::chrono::milliseconds(std::stoll(*value)));
        return;
    }
    throw UnsupportedOperation(driverName(), "set " + name);
}

SqlValue SQLiteConnection::invoke(const std::string& operation, const std::vector<std::string>& args) {
    if (operation == "busy_timeout") {
        if (!args.empty()) {
            setBusyTimeout(std::chrono::milliseconds(std::stoll(args[0])));
        }
        return std::to_string(m_busyTimeout.count());
    }
    if (operation == "changes") {
        return std::to_string(sqlite3_changes(handle()));
    }
    if (operation == "close") {
        close();
        return std::string("1");
    }
    return Connection::invoke(operation, args);
}

// ============================================================================
// Helpers
// ============================================================================

sqlite3* SQLiteConnection::handle() {
    if (!m_db) {
        throw DriverError("SQLite", SQLITE_MISUSE, "Database '" + m_path + "' is closed");
    }
    return m_db;
}

void SQLiteConnection::fail(int rc, const std::string& context) {
    throw DriverError("SQLite", rc, context + ": " + sqlite3_errmsg(m_db));
}

void SQLiteConnection::setBusyTimeout(std::chrono::milliseconds timeout) {
    int rc = sqlite3_busy_timeout(handle(), static_cast<int>(timeout.count()));
    if (rc != SQLITE_OK) {
        fail(rc, "busy_timeout");
    }
    m_busyTimeout = timeout;
}

}  // namespace safedb
