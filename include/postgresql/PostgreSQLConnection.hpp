#pragma once

/**
 * @file PostgreSQLConnection.hpp
 * @brief Physical connection to a PostgreSQL server over libpq.
 *
 * Usage:
 * @code
 *   PostgreSQLConnection conn("postgresql://app@db.internal/orders", "", "secret");
 *   ResultSet rs = conn.query("SELECT id, status FROM orders LIMIT 10");
 * @endcode
 */

#include "Connection.hpp"
#include "Config.hpp"
#include <libpq-fe.h>
#include <string>

namespace safedb {

class PostgreSQLConnection : public Connection {
public:
    /**
     * @brief Connect using individual connection parameters.
     * @throws DriverError if the connection cannot be established.
     */
    explicit PostgreSQLConnection(const ConnectionConfig& config);

    /**
     * @brief Connect using a libpq connection string or URI.
     * @param conninfo "postgresql://..." URI or "key=value" string.
     * @param user Overrides the user in conninfo when non-empty.
     * @param password Overrides the password in conninfo when non-empty.
     * @throws DriverError if the connection cannot be established.
     */
    PostgreSQLConnection(const std::string& conninfo,
                         const std::string& user,
                         const std::string& password);

    /**
     * @brief Finishes the session, unless inactiveDestroy() is set.
     */
    ~PostgreSQLConnection() override;

    std::string driverName() const override { return "PostgreSQL"; }
    bool isActive() const override;
    bool ping() override;

    uint64_t execute(const std::string& sql) override;
    ResultSet query(const std::string& sql) override;

    void begin() override;
    void commit() override;
    void rollback() override;

    std::vector<std::string> tables() override;
    std::vector<ColumnInfo> columns(const std::string& table) override;

    /**
     * @brief Value of lastval() in this session.
     * @throws DriverError if no sequence was used yet.
     */
    uint64_t lastInsertId() override;
    std::string quote(const std::string& value) override;

    /**
     * Known attributes: Name (database), Driver, pg_server_version,
     * pg_backend_pid, pg_transaction_status.
     */
    SqlValue attribute(const std::string& name) override;
    void setAttribute(const std::string& name, const SqlValue& value) override;

    /**
     * Operations: "quote_identifier" (name), "backend_pid".
     */
    SqlValue invoke(const std::string& operation, const std::vector<std::string>& args) override;

    // Raw handle, still owned by this object
    PGconn* get() const { return m_conn; }

private:
    void connect(const char* const* keywords, const char* const* values);
    PGconn* handle();
    PGresult* run(const std::string& sql);
    [[noreturn]] void fail(PGresult* result, const std::string& context);

    PGconn* m_conn = nullptr;
};

}  // namespace safedb
