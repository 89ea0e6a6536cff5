#pragma once

/**
 * @file Connection.hpp
 * @brief Capability interface shared by physical connections and the proxy.
 *
 * Every database backend (SQLite, MySQL, PostgreSQL) implements Connection,
 * and so does SafeConnection, which lets callers hold a proxy wherever they
 * would hold a plain connection.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace safedb {

// Represents a single value that can be null
using SqlValue = std::optional<std::string>;

struct ColumnInfo {
    std::string name;
    std::string type;
    bool nullable = true;
    bool primary_key = false;
};

struct ResultSet {
    std::vector<std::string> columns;
    std::vector<std::vector<SqlValue>> rows;

    bool empty() const { return rows.empty(); }
    size_t rowCount() const { return rows.size(); }
};

/**
 * @class Connection
 * @brief A database session that statements can be executed against.
 *
 * Implementations report failures by throwing (DriverError for driver
 * failures). ping() is the exception: it answers false instead.
 *
 * Thread Safety:
 * - Physical connections are NOT thread-safe; one thread uses a given
 *   connection at a time.
 */
class Connection {
public:
    virtual ~Connection() = default;

    // Non-copyable, non-movable: the proxy hands out references
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /**
     * @brief Name of the driver behind this connection ("SQLite", "MySQL", ...).
     */
    virtual std::string driverName() const = 0;

    /**
     * @brief Check if the session is open as far as the client library knows.
     * @return false once the session was closed or failed to establish.
     */
    virtual bool isActive() const = 0;

    /**
     * @brief Round trip to the server to verify the session still answers.
     * @return true if the server responded.
     */
    virtual bool ping() = 0;

    /**
     * @brief Execute a statement that does not return rows.
     * @param sql The SQL statement to execute.
     * @return Number of rows affected.
     */
    virtual uint64_t execute(const std::string& sql) = 0;

    /**
     * @brief Execute a statement and fetch all of its rows.
     * @param sql The SQL statement to execute.
     * @return Column names and rows.
     */
    virtual ResultSet query(const std::string& sql) = 0;

    virtual void begin() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;

    // Metadata introspection
    virtual std::vector<std::string> tables() = 0;
    virtual std::vector<ColumnInfo> columns(const std::string& table) = 0;

    virtual uint64_t lastInsertId() = 0;

    /**
     * @brief Quote a value as an SQL string literal, surrounding quotes included.
     */
    virtual std::string quote(const std::string& value) = 0;

    /**
     * @brief Read a named connection attribute.
     * @return The value, or std::nullopt if the attribute is unknown or NULL.
     */
    virtual SqlValue attribute(const std::string& name) = 0;

    /**
     * @brief Write a named connection attribute.
     * @throws UnsupportedOperation if the attribute cannot be written.
     */
    virtual void setAttribute(const std::string& name, const SqlValue& value) = 0;

    /**
     * @brief Call a driver-specific operation by name.
     * @param operation Operation name, e.g. "busy_timeout" for SQLite.
     * @param args Operation arguments.
     * @throws UnsupportedOperation if the driver does not know the operation.
     */
    virtual SqlValue invoke(const std::string& operation, const std::vector<std::string>& args);

    /**
     * @brief Keep the underlying session open when this object is destroyed.
     *
     * Set on a connection inherited from another process: closing it would
     * tear down the socket the other process is still using.
     */
    void setInactiveDestroy(bool value) { m_inactiveDestroy = value; }
    bool inactiveDestroy() const { return m_inactiveDestroy; }

protected:
    Connection() = default;

private:
    bool m_inactiveDestroy = false;
};

}  // namespace safedb
