#include "StalenessPolicy.hpp"

namespace safedb {

StalenessPolicy StalenessPolicies::never() {
    return [](const ConnectionState&) { return false; };
}

StalenessPolicy StalenessPolicies::olderThan(Clock::duration maxAge, ClockSource clock) {
    if (!clock) {
        clock = [] { return Clock::now(); };
    }
    return [maxAge, clock](const ConnectionState& state) {
        return periodExpired(state, maxAge, clock());
    };
}

bool StalenessPolicies::periodExpired(const ConnectionState& state,
                                      const std::optional<Clock::duration>& period,
                                      Clock::time_point now) {
    if (!period || period->count() <= 0 || !state.last_connected_at) {
        return false;
    }
    return now - *state.last_connected_at > *period;
}

}  // namespace safedb
