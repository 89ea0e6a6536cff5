#pragma once

/**
 * @file TransactionTracker.hpp
 * @brief begin/commit/rollback bookkeeping that keeps reconnects out of transactions.
 *
 * States: NORMAL (depth 0, autocommit on) and IN_TRANSACTION (depth 1,
 * autocommit off). Nested begin() is rejected rather than coalesced.
 *
 * Because the depth is positive for the whole transaction, any reconnect
 * the engine would need in that window fails with TransactionViolation
 * instead of silently replacing the session that holds the work.
 */

#include "ConnectionState.hpp"
#include "ErrorHandler.hpp"
#include "ReconnectionEngine.hpp"

namespace safedb {

class TransactionTracker {
public:
    TransactionTracker(ConnectionState& state, ReconnectionEngine& engine);

    /**
     * @brief Open a transaction on the live connection.
     * @throws TransactionViolation if a transaction is already open.
     */
    void begin();

    /**
     * @brief Commit the open transaction.
     * @throws TransactionViolation without a matching begin(), or if the
     *         session was lost since begin().
     */
    void commit();

    /**
     * @brief Roll back the open transaction.
     * @throws TransactionViolation without a matching begin(), or if a
     *         reconnect happened since begin() (rollback impossible).
     */
    void rollback();

    // Forget an open transaction (the session holding it is gone)
    void reset();

    bool inTransaction() const { return m_state.inTransaction(); }

private:
    void requireOpen(TransactionFault fault, const char* operation);
    void leave();

    ConnectionState& m_state;
    ReconnectionEngine& m_engine;
};

}  // namespace safedb
