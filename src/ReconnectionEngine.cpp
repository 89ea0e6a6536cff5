#include "ReconnectionEngine.hpp"
#include "ErrorHandler.hpp"
#include "LivenessProbe.hpp"
#include <spdlog/spdlog.h>

namespace safedb {

ReconnectionEngine::ReconnectionEngine(SafeOptions options)
    : m_connectFactory(ConnectFactoryAdapter::resolve(options.connect_factory, options.dsn_args))
    , m_retryPolicy(std::move(options.retry_policy))
    , m_stalenessPolicy(std::move(options.staleness_policy))
    , m_reconnectPeriod(options.reconnect_period)
    , m_clock(std::move(options.clock))
    , m_identity(std::move(options.identity)) {
    if (!m_retryPolicy) m_retryPolicy = RetryPolicies::once();
    if (!m_stalenessPolicy) m_stalenessPolicy = StalenessPolicies::never();
    if (!m_clock) m_clock = [] { return Clock::now(); };
    if (!m_identity) m_identity = [] { return OwnershipToken::current(); };
}

Connection& ReconnectionEngine::ensureConnected(ConnectionState& state) {
    ReconnectReason reason = checkConnection(state);
    if (reason == ReconnectReason::None) {
        return *state.physical;
    }
    return reconnect(state, reason);
}

ReconnectReason ReconnectionEngine::checkConnection(ConnectionState& state) {
    if (!state.physical) {
        return ReconnectReason::NoConnection;
    }

    OwnershipToken current = m_identity();

    // Never close a session that the parent process still uses
    bool processChanged = state.owner_process_id != current.process_id;
    if (processChanged) {
        state.physical->setInactiveDestroy(true);
    }

    if (state.owner_thread_id != current.thread_id) {
        return ReconnectReason::ThreadChanged;
    }
    if (processChanged) {
        return ReconnectReason::ProcessChanged;
    }
    if (!LivenessProbe::isAlive(*state.physical)) {
        return ReconnectReason::Dead;
    }
    if (m_stalenessPolicy(state)) {
        return ReconnectReason::Stale;
    }
    if (StalenessPolicies::periodExpired(state, m_reconnectPeriod, m_clock())) {
        return ReconnectReason::PeriodExpired;
    }
    return ReconnectReason::None;
}

Connection& ReconnectionEngine::reconnect(ConnectionState& state, ReconnectReason reason) {
    if (state.inTransaction()) {
        spdlog::error("Reconnect needed ({}) while in transaction (depth {})",
                      reasonToString(reason), state.transaction_depth);
        throw TransactionViolation(TransactionFault::ReconnectInTransaction,
                                   "Reconnect needed when db in transaction");
    }

    ErrorContext ctx("reconnect: " + reasonToString(reason));
    if (reason == ReconnectReason::NoConnection) {
        spdlog::debug("Connecting");
    } else {
        spdlog::info("Reconnecting: {}", reasonToString(reason));
    }

    state.last_reconnect_at = m_clock();
    state.last_error.clear();

    for (int attempt = 1;; ++attempt) {
        if (!m_retryPolicy(attempt)) {
            if (state.last_error.empty()) {
                state.last_error = "retry policy allowed no connection attempt";
            }
            spdlog::error("[{}] giving up after {} attempt(s): {}",
                          ErrorContext::current(), attempt - 1, state.last_error);
            throw ConnectionExhausted(attempt - 1, state.last_error);
        }

        try {
            std::unique_ptr<Connection> conn = m_connectFactory();
            if (!conn) {
                state.last_error = "connect factory returned no connection";
                spdlog::warn("[{}] attempt {} failed: {}", ErrorContext::current(), attempt, state.last_error);
                continue;
            }

            OwnershipToken owner = m_identity();
            state.physical = std::move(conn);
            state.owner_process_id = owner.process_id;
            state.owner_thread_id = owner.thread_id;
            state.last_connected_at = m_clock();
            ++state.reconnect_count;

            spdlog::info("Connected to {} (attempt {}, connect #{})",
                         state.physical->driverName(), attempt, state.reconnect_count);
            return *state.physical;
        } catch (const ConfigurationError& e) {
            // Retrying cannot fix a bad setup
            state.last_error = ErrorHandler::describe(e);
            spdlog::error("[{}] attempt {} failed: {}", ErrorContext::current(), attempt, state.last_error);
            throw;
        } catch (const std::exception& e) {
            state.last_error = ErrorHandler::describe(e);
            spdlog::warn("[{}] attempt {} failed: {}", ErrorContext::current(), attempt, state.last_error);
        }
    }
}

std::string ReconnectionEngine::reasonToString(ReconnectReason reason) {
    switch (reason) {
        case ReconnectReason::None:
            return "none";
        case ReconnectReason::NoConnection:
            return "no connection";
        case ReconnectReason::ThreadChanged:
            return "thread changed";
        case ReconnectReason::ProcessChanged:
            return "process changed";
        case ReconnectReason::Dead:
            return "connection is dead";
        case ReconnectReason::Stale:
            return "staleness policy";
        case ReconnectReason::PeriodExpired:
            return "reconnect period expired";
    }
    return "unknown";
}

}  // namespace safedb
