#include "CallForwarder.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace safedb {

namespace {

void requireArgs(const std::string& operation, const std::vector<std::string>& args, size_t count) {
    if (args.size() != count) {
        throw std::invalid_argument(operation + "() expects " + std::to_string(count) +
                                    " argument(s), got " + std::to_string(args.size()));
    }
}

}  // namespace

CallForwarder::CallForwarder(ConnectionState& state, ReconnectionEngine& engine)
    : m_state(state)
    , m_engine(engine) {
}

SqlValue CallForwarder::forward(const std::string& operation, const std::vector<std::string>& args) {
    const Forwarder& forwarder = lookup(operation);
    Connection& conn = m_engine.ensureConnected(m_state);
    return forwarder(conn, args);
}

bool CallForwarder::isCached(const std::string& operation) const {
    return m_cache.find(operation) != m_cache.end();
}

const Forwarder& CallForwarder::lookup(const std::string& operation) {
    auto it = m_cache.find(operation);
    if (it == m_cache.end()) {
        spdlog::debug("Binding forwarder for '{}'", operation);
        it = m_cache.emplace(operation, resolve(operation)).first;
    }
    return it->second;
}

Forwarder CallForwarder::resolve(const std::string& operation) {
    if (operation == "do" || operation == "execute") {
        return [operation](Connection& conn, const std::vector<std::string>& args) -> SqlValue {
            requireArgs(operation, args, 1);
            return std::to_string(conn.execute(args[0]));
        };
    }
    if (operation == "ping") {
        return [operation](Connection& conn, const std::vector<std::string>& args) -> SqlValue {
            requireArgs(operation, args, 0);
            return std::string(conn.ping() ? "1" : "0");
        };
    }
    if (operation == "last_insert_id") {
        return [operation](Connection& conn, const std::vector<std::string>& args) -> SqlValue {
            requireArgs(operation, args, 0);
            return std::to_string(conn.lastInsertId());
        };
    }
    if (operation == "quote") {
        return [operation](Connection& conn, const std::vector<std::string>& args) -> SqlValue {
            requireArgs(operation, args, 1);
            return conn.quote(args[0]);
        };
    }

    // Driver-specific operation
    return [operation](Connection& conn, const std::vector<std::string>& args) {
        return conn.invoke(operation, args);
    };
}

}  // namespace safedb
