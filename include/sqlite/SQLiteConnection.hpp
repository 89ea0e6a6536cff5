#pragma once

/**
 * @file SQLiteConnection.hpp
 * @brief Physical connection to an SQLite database file.
 *
 * Usage:
 * @code
 *   SQLiteConnection conn("/path/to/database.db");
 *   conn.execute("CREATE TABLE IF NOT EXISTS test (id INTEGER)");
 *   ResultSet rows = conn.query("SELECT * FROM test");
 * @endcode
 *
 * SQLite Characteristics:
 * - File-based: One database per file (":memory:" for a private in-memory one)
 * - Serverless: isActive() and ping() only fail once the handle is closed
 *   or the file became unreadable
 *
 * Thread Safety:
 * - Opened with SQLITE_OPEN_FULLMUTEX (serialized mode)
 */

#include "Connection.hpp"
#include <sqlite3.h>
#include <chrono>
#include <string>

namespace safedb {

class SQLiteConnection : public Connection {
public:
    /**
     * @brief Open (creating if needed) an SQLite database file.
     * @param dbPath Path to the database file, or ":memory:".
     * @param busyTimeout How long to wait on a locked database.
     * @throws DriverError if the file cannot be opened.
     */
    explicit SQLiteConnection(const std::string& dbPath,
                              std::chrono::milliseconds busyTimeout = std::chrono::milliseconds{5000});

    /**
     * @brief Closes the database handle, unless inactiveDestroy() is set.
     */
    ~SQLiteConnection() override;

    std::string driverName() const override { return "SQLite"; }
    bool isActive() const override { return m_db != nullptr; }
    bool ping() override;

    uint64_t execute(const std::string& sql) override;
    ResultSet query(const std::string& sql) override;

    void begin() override;
    void commit() override;
    void rollback() override;

    std::vector<std::string> tables() override;
    std::vector<ColumnInfo> columns(const std::string& table) override;

    uint64_t lastInsertId() override;
    std::string quote(const std::string& value) override;

    /**
     * Known attributes: Name (file path), Driver, sqlite_version,
     * busy_timeout (ms, writable).
     */
    SqlValue attribute(const std::string& name) override;
    void setAttribute(const std::string& name, const SqlValue& value) override;

    /**
     * Operations: "busy_timeout" (ms), "changes", "close".
     */
    SqlValue invoke(const std::string& operation, const std::vector<std::string>& args) override;

    /**
     * @brief Close the handle now. Later operations throw.
     */
    void close();

    // Raw handle, still owned by this object
    sqlite3* get() const { return m_db; }

    const std::string& path() const { return m_path; }

private:
    sqlite3* handle();
    [[noreturn]] void fail(int rc, const std::string& context);
    void setBusyTimeout(std::chrono::milliseconds timeout);

    sqlite3* m_db = nullptr;                  ///< SQLite database handle
    std::string m_path;                       ///< Path to database file
    std::chrono::milliseconds m_busyTimeout;  ///< Current busy timeout
};

}  // namespace safedb
