#pragma once

/**
 * @file CallForwarder.hpp
 * @brief Forwards any named operation to the live physical connection.
 *
 * Catch-all for operations the proxy does not implement itself. The name
 * is bound to a forwarding closure on first use and the binding is cached
 * per name.
 *
 * Built-in bindings:
 * - "do" / "execute" (sql): rows affected
 * - "ping": "1" or "0"
 * - "last_insert_id"
 * - "quote" (value)
 * Any other name is passed to Connection::invoke().
 */

#include "Connection.hpp"
#include "ConnectionState.hpp"
#include "ReconnectionEngine.hpp"
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace safedb {

using Forwarder = std::function<SqlValue(Connection& conn, const std::vector<std::string>& args)>;

class CallForwarder {
public:
    CallForwarder(ConnectionState& state, ReconnectionEngine& engine);

    /**
     * @brief Ensure a live connection, then run the operation on it.
     * @return The operation's result; errors propagate unchanged.
     * @throws std::invalid_argument if a built-in gets the wrong number of arguments.
     */
    SqlValue forward(const std::string& operation, const std::vector<std::string>& args);

    bool isCached(const std::string& operation) const;
    size_t cachedCount() const { return m_cache.size(); }

    // Build the forwarding closure for an operation name
    static Forwarder resolve(const std::string& operation);

private:
    const Forwarder& lookup(const std::string& operation);

    ConnectionState& m_state;
    ReconnectionEngine& m_engine;
    std::unordered_map<std::string, Forwarder> m_cache;
};

}  // namespace safedb
