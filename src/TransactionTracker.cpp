#include "TransactionTracker.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace safedb {

TransactionTracker::TransactionTracker(ConnectionState& state, ReconnectionEngine& engine)
    : m_state(state)
    , m_engine(engine) {
}

void TransactionTracker::begin() {
    if (m_state.inTransaction()) {
        spdlog::error("begin() called while already in a transaction");
        throw TransactionViolation(TransactionFault::AlreadyInTransaction,
                                   "Already in a transaction");
    }

    // Connect first: the lazy first connect is not a reconnect inside a transaction
    Connection& conn = m_engine.ensureConnected(m_state);

    m_state.autocommit = false;
    ++m_state.transaction_depth;
    m_state.transaction_start_time = m_engine.now();

    try {
        conn.begin();
    } catch (const std::exception& e) {
        spdlog::debug("begin() failed, transaction not opened: {}", e.what());
        reset();
        throw;
    }
}

void TransactionTracker::commit() {
    requireOpen(TransactionFault::CommitWithoutBegin, "commit");

    Connection* conn = nullptr;
    try {
        conn = &m_engine.ensureConnected(m_state);
    } catch (const TransactionViolation&) {
        // The session holding the transaction is gone; nothing left to commit
        reset();
        throw;
    }

    leave();
    try {
        conn->commit();
    } catch (const std::exception&) {
        if (!m_state.inTransaction()) {
            m_state.autocommit = true;
        }
        throw;
    }
    if (!m_state.inTransaction()) {
        m_state.autocommit = true;
    }
}

void TransactionTracker::rollback() {
    requireOpen(TransactionFault::RollbackWithoutBegin, "rollback");

    Connection* conn = nullptr;
    try {
        conn = &m_engine.ensureConnected(m_state);
    } catch (const TransactionViolation&) {
        reset();
        spdlog::error("Disconnect occurred during transaction, rollback impossible");
        throw TransactionViolation(TransactionFault::DisconnectDuringTransaction,
                                   "Disconnect occurred during transaction, rollback impossible");
    }

    if (m_state.last_reconnect_at && m_state.transaction_start_time &&
        *m_state.last_reconnect_at > *m_state.transaction_start_time) {
        reset();
        spdlog::error("Disconnect occurred during transaction, rollback impossible");
        throw TransactionViolation(TransactionFault::DisconnectDuringTransaction,
                                   "Disconnect occurred during transaction, rollback impossible");
    }

    leave();
    try {
        conn->rollback();
    } catch (const std::exception&) {
        if (!m_state.inTransaction()) {
            m_state.autocommit = true;
        }
        throw;
    }
    if (!m_state.inTransaction()) {
        m_state.autocommit = true;
    }
}

void TransactionTracker::reset() {
    m_state.transaction_depth = 0;
    m_state.autocommit = true;
    m_state.transaction_start_time.reset();
}

void TransactionTracker::requireOpen(TransactionFault fault, const char* operation) {
    if (m_state.autocommit) {
        std::string message = std::string(operation) + "() without begin()";
        spdlog::error("{}", message);
        throw TransactionViolation(fault, message);
    }
}

void TransactionTracker::leave() {
    --m_state.transaction_depth;
    if (m_state.transaction_depth < 0) {
        m_state.transaction_depth = 0;
        m_state.last_error = "transaction end without begin()";
        spdlog::error("Transaction depth went below zero, clamped");
    }
    if (m_state.transaction_depth == 0) {
        m_state.transaction_start_time.reset();
    }
}

}  // namespace safedb
