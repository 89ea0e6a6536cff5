#pragma once

/**
 * @file StalenessPolicy.hpp
 * @brief Forced-reconnect triggers that are independent of liveness.
 *
 * Two triggers are evaluated independently: a caller-supplied policy over
 * the connection state, and an optional reconnect period measured from the
 * last successful connect.
 */

#include "ConnectionState.hpp"
#include <chrono>
#include <functional>
#include <optional>

namespace safedb {

using StalenessPolicy = std::function<bool(const ConnectionState& state)>;
using ClockSource = std::function<Clock::time_point()>;

class StalenessPolicies {
public:
    // Never forces a reconnect
    static StalenessPolicy never();

    // Stale once the connection is older than maxAge according to clock
    static StalenessPolicy olderThan(Clock::duration maxAge, ClockSource clock);

    /**
     * @brief Check the reconnect period trigger.
     * @return true if period is set, the state has connected before, and
     *         now - last_connected_at > period.
     */
    static bool periodExpired(const ConnectionState& state,
                              const std::optional<Clock::duration>& period,
                              Clock::time_point now);
};

}  // namespace safedb
