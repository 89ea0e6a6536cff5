#pragma once

/**
 * @file ConnectionState.hpp
 * @brief Mutable record behind one logical (proxy) connection.
 */

#include "Connection.hpp"
#include <sys/types.h>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace safedb {

using Clock = std::chrono::steady_clock;

/**
 * @struct OwnershipToken
 * @brief Process and thread identity a physical connection was created under.
 */
struct OwnershipToken {
    pid_t process_id = 0;
    std::thread::id thread_id;

    // Identity of the calling thread in the current process
    static OwnershipToken current();

    bool operator==(const OwnershipToken& other) const {
        return process_id == other.process_id && thread_id == other.thread_id;
    }
    bool operator!=(const OwnershipToken& other) const { return !(*this == other); }
};

/**
 * @struct ConnectionState
 * @brief State of one proxy instance.
 *
 * Exclusively owned by its proxy. Only the reconnection engine and the
 * transaction tracker mutate it.
 *
 * Invariants:
 * - physical is empty or was produced by the connect factory
 * - owner_process_id/owner_thread_id are the identity physical was created under
 * - transaction_depth never goes below zero
 */
struct ConnectionState {
    std::unique_ptr<Connection> physical;

    pid_t owner_process_id = 0;
    std::thread::id owner_thread_id;

    std::optional<Clock::time_point> last_connected_at;
    std::optional<Clock::time_point> last_reconnect_at;
    std::optional<Clock::time_point> transaction_start_time;

    std::string last_error;  ///< Most recent connection failure

    int transaction_depth = 0;
    bool autocommit = true;   ///< false while a transaction is open

    uint64_t reconnect_count = 0;  ///< Successful connects, first one included

    bool inTransaction() const { return transaction_depth > 0; }

    OwnershipToken owner() const { return OwnershipToken{owner_process_id, owner_thread_id}; }
};

}  // namespace safedb
