#pragma once

/**
 * @file MySQLConnection.hpp
 * @brief Physical connection to a MySQL/MariaDB server.
 *
 * The client library's own auto-reconnect (MYSQL_OPT_RECONNECT) is turned
 * off: a driver-level reconnect would drop an open transaction without
 * telling anyone. Lost sessions surface through ping() instead and are
 * replaced by the proxy.
 */

#include "Connection.hpp"
#include "Config.hpp"
#include <mysql/mysql.h>
#include <string>

namespace safedb {

class MySQLConnection : public Connection {
public:
    /**
     * @brief Connect using the given parameters.
     * @throws DriverError if the connection cannot be established.
     */
    explicit MySQLConnection(const ConnectionConfig& config);

    /**
     * @brief Closes the session, unless inactiveDestroy() is set.
     */
    ~MySQLConnection() override;

    std::string driverName() const override { return "MySQL"; }
    bool isActive() const override { return m_conn != nullptr; }

    // mysql_ping() round trip; never reconnects
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
     * Known attributes: Name (database), Driver, mysql_serverinfo,
     * mysql_hostinfo, mysql_thread_id.
     */
    SqlValue attribute(const std::string& name) override;
    void setAttribute(const std::string& name, const SqlValue& value) override;

    /**
     * Operations: "select_db" (database), "thread_id".
     */
    SqlValue invoke(const std::string& operation, const std::vector<std::string>& args) override;

    // Raw handle, still owned by this object
    MYSQL* get() const { return m_conn; }

private:
    MYSQL* handle();
    [[noreturn]] void fail(const std::string& context);
    void runQuery(const std::string& sql);

    MYSQL* m_conn = nullptr;    ///< Client handle
    std::string m_database;     ///< Default database
};

}  // namespace safedb
