#include "SafeConnection.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace safedb {

namespace {

bool isTrue(const SqlValue& value) {
    return value && !value->empty() && *value != "0";
}

SqlValue flag(bool value) {
    return std::string(value ? "1" : "0");
}

}  // namespace

SafeConnection::SafeConnection(SafeOptions options)
    : m_engine(std::move(options))
    , m_tracker(m_state, m_engine)
    , m_forwarder(m_state, m_engine) {
}

SafeConnection::~SafeConnection() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state.inTransaction()) {
        spdlog::warn("Proxy destroyed with an open transaction");
    }
    releasePhysical();
}

template <typename Fn>
auto SafeConnection::remote(const char* operation, Fn&& fn)
    -> decltype(fn(std::declval<Connection&>())) {
    std::lock_guard<std::mutex> lock(m_mutex);
    try {
        Connection& conn = m_engine.ensureConnected(m_state);
        m_active = true;
        return fn(conn);
    } catch (const std::exception& e) {
        reportFailure(operation, e);
        throw;
    }
}

void SafeConnection::reportFailure(const char* operation, const std::exception& e) const {
    if (m_printError) {
        spdlog::error("{} failed: {}", operation, ErrorHandler::describe(e));
    }
}

bool SafeConnection::isActive() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active;
}

bool SafeConnection::ping() {
    try {
        return remote("ping", [](Connection& conn) { return conn.ping(); });
    } catch (const std::exception& e) {
        spdlog::debug("ping: {}", ErrorHandler::describe(e));
        return false;
    }
}

uint64_t SafeConnection::execute(const std::string& sql) {
    return remote("execute", [&sql](Connection& conn) { return conn.execute(sql); });
}

ResultSet SafeConnection::query(const std::string& sql) {
    return remote("query", [&sql](Connection& conn) { return conn.query(sql); });
}

void SafeConnection::begin() {
    std::lock_guard<std::mutex> lock(m_mutex);
    try {
        m_tracker.begin();
        m_active = true;
    } catch (const std::exception& e) {
        reportFailure("begin", e);
        throw;
    }
}

void SafeConnection::commit() {
    std::lock_guard<std::mutex> lock(m_mutex);
    try {
        m_tracker.commit();
    } catch (const std::exception& e) {
        reportFailure("commit", e);
        throw;
    }
}

void SafeConnection::rollback() {
    std::lock_guard<std::mutex> lock(m_mutex);
    try {
        m_tracker.rollback();
    } catch (const std::exception& e) {
        reportFailure("rollback", e);
        throw;
    }
}

std::vector<std::string> SafeConnection::tables() {
    return remote("tables", [](Connection& conn) { return conn.tables(); });
}

std::vector<ColumnInfo> SafeConnection::columns(const std::string& table) {
    return remote("columns", [&table](Connection& conn) { return conn.columns(table); });
}

uint64_t SafeConnection::lastInsertId() {
    return remote("last_insert_id", [](Connection& conn) { return conn.lastInsertId(); });
}

std::string SafeConnection::quote(const std::string& value) {
    return remote("quote", [&value](Connection& conn) { return conn.quote(value); });
}

SqlValue SafeConnection::attribute(const std::string& name) {
    if (m_router.route(name) == AttributeScope::Local) {
        std::lock_guard<std::mutex> lock(m_mutex);
        return localAttribute(name);
    }
    return remote("attribute", [&name](Connection& conn) { return conn.attribute(name); });
}

void SafeConnection::setAttribute(const std::string& name, const SqlValue& value) {
    if (m_router.route(name) == AttributeScope::Local) {
        if (m_router.isReadOnly(name)) {
            throw ConfigurationError("Attribute '" + name + "' is managed by the proxy and cannot be set");
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        setLocalAttribute(name, value);
        return;
    }
    remote("setAttribute", [&name, &value](Connection& conn) { conn.setAttribute(name, value); });
}

SqlValue SafeConnection::invoke(const std::string& operation, const std::vector<std::string>& args) {
    if (operation == "begin_work" || operation == "begin") {
        begin();
        return flag(true);
    }
    if (operation == "commit") {
        commit();
        return flag(true);
    }
    if (operation == "rollback") {
        rollback();
        return flag(true);
    }
    if (operation == "disconnect") {
        disconnect();
        return flag(true);
    }
    if (operation == "x_safe_get_dbh") {
        return physicalConnection().driverName();
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    try {
        SqlValue result = m_forwarder.forward(operation, args);
        m_active = true;
        return result;
    } catch (const std::exception& e) {
        reportFailure(operation.c_str(), e);
        throw;
    }
}

Connection& SafeConnection::physicalConnection() {
    return remote("x_safe_get_dbh", [](Connection& conn) -> Connection& { return conn; });
}

void SafeConnection::disconnect() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state.inTransaction()) {
        spdlog::warn("disconnect() abandons an open transaction");
        m_tracker.reset();
    }
    releasePhysical();
    m_active = false;
}

bool SafeConnection::inTransaction() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state.inTransaction();
}

SqlValue SafeConnection::localAttribute(const std::string& name) const {
    if (name == "Active") return flag(m_active);
    if (name == "AutoCommit") return flag(m_state.autocommit);
    if (name == "PrintError") return flag(m_printError);
    if (name == "RaiseError") return flag(m_raiseError);
    if (name == "x_safe_in_transaction") return std::to_string(m_state.transaction_depth);
    if (name == "x_safe_reconnect_count") return std::to_string(m_state.reconnect_count);
    if (name == "x_safe_last_error") {
        if (m_state.last_error.empty()) return std::nullopt;
        return m_state.last_error;
    }
    if (name == "x_safe_last_connected") {
        if (!m_state.last_connected_at) return std::nullopt;
        auto age = std::chrono::duration_cast<std::chrono::seconds>(
            m_engine.now() - *m_state.last_connected_at);
        return std::to_string(age.count());
    }

    auto it = m_localAttributes.find(name);
    if (it == m_localAttributes.end()) {
        return std::nullopt;
    }
    return it->second;
}

void SafeConnection::setLocalAttribute(const std::string& name, const SqlValue& value) {
    if (name == "Active") {
        m_active = isTrue(value);
    } else if (name == "PrintError") {
        m_printError = isTrue(value);
    } else if (name == "RaiseError") {
        if (!isTrue(value)) {
            spdlog::debug("RaiseError=0 has no effect, errors are always raised");
        }
        m_raiseError = isTrue(value);
    } else {
        m_localAttributes[name] = value;
    }
}

void SafeConnection::releasePhysical() {
    if (!m_state.physical) {
        return;
    }
    if (m_state.owner_process_id != m_engine.identity().process_id) {
        m_state.physical->setInactiveDestroy(true);
    }
    m_state.physical.reset();
}

}  // namespace safedb
