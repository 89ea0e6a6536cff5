#pragma once

/**
 * @file ReconnectionEngine.hpp
 * @brief Decides when the physical connection must be replaced, and replaces it.
 *
 * ensureConnected() is called before every forwarded operation. On return
 * the state holds a usable physical connection; otherwise it throws.
 *
 * A reconnect is needed when any of these hold, checked in order:
 * 1. there is no physical connection yet
 * 2. the calling thread is not the one that created it
 * 3. the calling process is not the one that created it (fork)
 * 4. the liveness probe reports it dead
 * 5. the staleness policy fires
 * 6. the reconnect period has expired
 *
 * A connection inherited across fork() is flagged inactiveDestroy before
 * it is dropped, so the child never closes the parent's session.
 */

#include "ConnectionState.hpp"
#include "SafeOptions.hpp"
#include <string>

namespace safedb {

enum class ReconnectReason {
    None,
    NoConnection,
    ThreadChanged,
    ProcessChanged,
    Dead,
    Stale,
    PeriodExpired
};

class ReconnectionEngine {
public:
    /**
     * @brief Build an engine from proxy options, filling in defaults.
     * @throws ConfigurationError if neither a connect factory nor DSN
     *         arguments are supplied.
     */
    explicit ReconnectionEngine(SafeOptions options);

    /**
     * @brief Make sure state holds a usable physical connection.
     * @return The (possibly new) physical connection, owned by state.
     * @throws TransactionViolation if a reconnect is needed inside a transaction.
     * @throws ConnectionExhausted if the retry policy declined another attempt.
     */
    Connection& ensureConnected(ConnectionState& state);

    /**
     * @brief Evaluate the reconnect triggers without reconnecting.
     *
     * Flags the physical connection inactiveDestroy when it belongs to
     * another process.
     */
    ReconnectReason checkConnection(ConnectionState& state);

    // Current time and identity, as seen through the injected sources
    Clock::time_point now() const { return m_clock(); }
    OwnershipToken identity() const { return m_identity(); }

    static std::string reasonToString(ReconnectReason reason);

private:
    Connection& reconnect(ConnectionState& state, ReconnectReason reason);

    ConnectFactory m_connectFactory;
    RetryPolicy m_retryPolicy;
    StalenessPolicy m_stalenessPolicy;
    std::optional<Clock::duration> m_reconnectPeriod;
    ClockSource m_clock;
    IdentitySource m_identity;
};

}  // namespace safedb
