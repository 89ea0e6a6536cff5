#pragma once

/**
 * @file SafeConnection.hpp
 * @brief Self-healing proxy in front of one physical database connection.
 *
 * SafeConnection implements Connection, so it can be used wherever a plain
 * connection is used. Before every operation that reaches the database it
 * checks the physical connection and replaces it when it was dropped, was
 * inherited across fork(), is used from another thread, or has gone stale.
 * Inside a transaction it refuses to reconnect and throws
 * TransactionViolation instead.
 *
 * The physical connection is created lazily on first use.
 *
 * Attributes:
 * - Local (never forwarded): Active, AutoCommit, PrintError, RaiseError and
 *   every x_safe_* name. AutoCommit, x_safe_in_transaction,
 *   x_safe_last_error, x_safe_reconnect_count and x_safe_last_connected are
 *   read-only.
 * - Everything else is read/written on the physical connection.
 *
 * Thread Safety:
 * - All operations are serialized by one mutex per instance. The mutex
 *   covers the connection check, any reconnect, and the forwarded call.
 */

#include "AttributeRouter.hpp"
#include "CallForwarder.hpp"
#include "Connection.hpp"
#include "ConnectionState.hpp"
#include "ReconnectionEngine.hpp"
#include "SafeOptions.hpp"
#include "TransactionTracker.hpp"
#include <map>
#include <mutex>
#include <utility>

namespace safedb {

class SafeConnection : public Connection {
public:
    /**
     * @throws ConfigurationError if options name no way to connect.
     */
    explicit SafeConnection(SafeOptions options);

    /**
     * @brief Closes the physical connection, unless another process created it.
     */
    ~SafeConnection() override;

    std::string driverName() const override { return "Safe"; }
    bool isActive() const override;

    // Never throws; a failed reconnect answers false
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

    SqlValue attribute(const std::string& name) override;

    /**
     * @throws ConfigurationError when writing AutoCommit or a read-only x_safe_ key.
     */
    void setAttribute(const std::string& name, const SqlValue& value) override;

    /**
     * @brief Call an operation by name.
     *
     * begin_work/begin, commit and rollback go through transaction
     * tracking; x_safe_get_dbh answers the physical driver name; disconnect
     * disconnects; anything else is forwarded to the physical connection.
     */
    SqlValue invoke(const std::string& operation, const std::vector<std::string>& args) override;

    /**
     * @brief Get the underlying live connection, reconnecting if needed.
     *
     * The reference stays valid until the next operation on this proxy.
     */
    Connection& physicalConnection();

    /**
     * @brief Close the physical connection and mark the proxy inactive.
     *
     * An open transaction is abandoned. The next operation that needs the
     * database connects again.
     */
    void disconnect();

    bool inTransaction() const;

    // Unsynchronized view of the bookkeeping, for diagnostics and tests
    const ConnectionState& state() const { return m_state; }

private:
    template <typename Fn>
    auto remote(const char* operation, Fn&& fn) -> decltype(fn(std::declval<Connection&>()));

    void reportFailure(const char* operation, const std::exception& e) const;
    SqlValue localAttribute(const std::string& name) const;
    void setLocalAttribute(const std::string& name, const SqlValue& value);
    void releasePhysical();

    mutable std::mutex m_mutex;
    ConnectionState m_state;
    ReconnectionEngine m_engine;
    TransactionTracker m_tracker;
    CallForwarder m_forwarder;
    AttributeRouter m_router;

    bool m_active = true;
    bool m_printError = false;
    bool m_raiseError = true;
    std::map<std::string, SqlValue> m_localAttributes;  ///< Caller-defined x_safe_* keys
};

}  // namespace safedb
