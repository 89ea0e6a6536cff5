#include "PostgreSQLConnection.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <vector>

namespace safedb {

namespace {

struct ResultDeleter {
    void operator()(PGresult* res) const { PQclear(res); }
};
using ResultPtr = std::unique_ptr<PGresult, ResultDeleter>;

// libpq messages end with a newline
std::string trimMessage(std::string msg) {
    while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r')) {
        msg.pop_back();
    }
    return msg;
}

}  // namespace

// ============================================================================
// Connection Creation
// ============================================================================

PostgreSQLConnection::PostgreSQLConnection(const ConnectionConfig& config) {
    std::vector<std::string> keys;
    std::vector<std::string> vals;
    auto add = [&](const char* key, const std::string& value) {
        if (!value.empty()) {
            keys.emplace_back(key);
            vals.push_back(value);
        }
    };

    // A socket directory takes the place of the host name
    add("host", config.socket.empty() ? config.host : config.socket);
    if (config.port != 0) {
        add("port", std::to_string(config.port));
    }
    add("user", config.user);
    add("password", config.password);
    add("dbname", config.default_database);

    // Timeout in seconds
    add("connect_timeout", std::to_string(config.connect_timeout.count() / 1000));

    // SSL options
    if (config.use_ssl) {
        add("sslmode", "require");
        add("sslrootcert", config.ssl_ca);
        add("sslcert", config.ssl_cert);
        add("sslkey", config.ssl_key);
    } else {
        add("sslmode", "prefer");
    }

    // Application name for identification
    add("application_name", "safedb");

    std::vector<const char*> keywords;
    std::vector<const char*> values;
    for (size_t i = 0; i < keys.size(); ++i) {
        keywords.push_back(keys[i].c_str());
        values.push_back(vals[i].c_str());
    }
    keywords.push_back(nullptr);
    values.push_back(nullptr);

    connect(keywords.data(), values.data());
}

PostgreSQLConnection::PostgreSQLConnection(const std::string& conninfo,
                                           const std::string& user,
                                           const std::string& password) {
    // With expand_dbname the first "dbname" entry is parsed as a full
    // connection string; later entries override what it sets
    std::vector<const char*> keywords = {"dbname"};
    std::vector<const char*> values = {conninfo.c_str()};
    if (!user.empty()) {
        keywords.push_back("user");
        values.push_back(user.c_str());
    }
    if (!password.empty()) {
        keywords.push_back("password");
        values.push_back(password.c_str());
    }
    keywords.push_back(nullptr);
    values.push_back(nullptr);

    connect(keywords.data(), values.data());
}

void PostgreSQLConnection::connect(const char* const* keywords, const char* const* values) {
    m_conn = PQconnectdbParams(keywords, values, 1);

    if (!m_conn) {
        throw DriverError("PostgreSQL", CONNECTION_BAD, "Failed to allocate PostgreSQL connection");
    }

    if (PQstatus(m_conn) != CONNECTION_OK) {
        std::string errorMsg = trimMessage(PQerrorMessage(m_conn));
        PQfinish(m_conn);
        m_conn = nullptr;
        throw DriverError("PostgreSQL", CONNECTION_BAD, "Failed to connect to PostgreSQL: " + errorMsg);
    }

    // Set client encoding to UTF-8
    PQsetClientEncoding(m_conn, "UTF8");

    spdlog::debug("Connected to PostgreSQL database '{}' (backend pid {})",
                  PQdb(m_conn), PQbackendPID(m_conn));
}

PostgreSQLConnection::~PostgreSQLConnection() {
    if (!m_conn) {
        return;
    }
    if (inactiveDestroy()) {
        spdlog::debug("Leaving PostgreSQL backend {} open", PQbackendPID(m_conn));
        return;
    }
    PQfinish(m_conn);
}

// ============================================================================
// Liveness
// ============================================================================

bool PostgreSQLConnection::isActive() const {
    return m_conn != nullptr && PQstatus(m_conn) == CONNECTION_OK;
}

bool PostgreSQLConnection::ping() {
    if (!m_conn) return false;

    // Try a simple query to check connection
    ResultPtr res(PQexec(m_conn, "SELECT 1"));
    return res && PQresultStatus(res.get()) == PGRES_TUPLES_OK;
}

// ============================================================================
// Query Execution
// ============================================================================

PGresult* PostgreSQLConnection::run(const std::string& sql) {
    PGresult* res = PQexec(handle(), sql.c_str());
    if (!res) {
        fail(nullptr, "exec");
    }
    ExecStatusType status = PQresultStatus(res);
    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
        fail(res, "exec");
    }
    return res;
}

uint64_t PostgreSQLConnection::execute(const std::string& sql) {
    ResultPtr res(run(sql));
    const char* affected = PQcmdTuples(res.get());
    if (!affected || !*affected) return 0;
    return std::strtoull(affected, nullptr, 10);
}

ResultSet PostgreSQLConnection::query(const std::string& sql) {
    ResultPtr res(run(sql));

    ResultSet result;
    int numFields = PQnfields(res.get());
    int numRows = PQntuples(res.get());

    for (int i = 0; i < numFields; ++i) {
        result.columns.emplace_back(PQfname(res.get(), i));
    }

    result.rows.reserve(static_cast<size_t>(numRows));
    for (int r = 0; r < numRows; ++r) {
        std::vector<SqlValue> row;
        row.reserve(static_cast<size_t>(numFields));
        for (int c = 0; c < numFields; ++c) {
            if (PQgetisnull(res.get(), r, c)) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(std::string(PQgetvalue(res.get(), r, c),
                                             static_cast<size_t>(PQgetlength(res.get(), r, c))));
            }
        }
        result.rows.push_back(std::move(row));
    }
    return result;
}

// ============================================================================
// Transactions
// ============================================================================

void PostgreSQLConnection::begin() {
    execute("BEGIN");
}

void PostgreSQLConnection::commit() {
    execute("COMMIT");
}

void PostgreSQLConnection::rollback() {
    execute("ROLLBACK");
}

// ============================================================================
// Metadata
// ============================================================================

std::vector<std::string> PostgreSQLConnection::tables() {
    ResultSet rs = query(
        "SELECT table_name FROM information_schema.tables "
        "WHERE table_schema = current_schema() AND table_type = 'BASE TABLE' "
        "ORDER BY table_name");

    std::vector<std::string> names;
    for (const auto& row : rs.rows) {
        if (!row.empty() && row[0]) {
            names.push_back(*row[0]);
        }
    }
    return names;
}

std::vector<ColumnInfo> PostgreSQLConnection::columns(const std::string& table) {
    ResultSet rs = query(
        "SELECT c.column_name, c.data_type, c.is_nullable, "
        "  EXISTS (SELECT 1 FROM information_schema.table_constraints tc "
        "          JOIN information_schema.key_column_usage k "
        "            ON tc.constraint_name = k.constraint_name "
        "           AND tc.table_schema = k.table_schema "
        "          WHERE tc.constraint_type = 'PRIMARY KEY' "
        "            AND tc.table_schema = c.table_schema "
        "            AND tc.table_name = c.table_name "
        "            AND k.column_name = c.column_name) AS is_pk "
        "FROM information_schema.columns c "
        "WHERE c.table_schema = current_schema() AND c.table_name = " + quote(table) +
        " ORDER BY c.ordinal_position");

    std::vector<ColumnInfo> result;
    for (const auto& row : rs.rows) {
        if (row.size() < 4) continue;
        ColumnInfo col;
        col.name = row[0].value_or("");
        col.type = row[1].value_or("");
        col.nullable = row[2].value_or("YES") == "YES";
        col.primary_key = row[3].value_or("f") == "t";
        result.push_back(std::move(col));
    }
    return result;
}

uint64_t PostgreSQLConnection::lastInsertId() {
    ResultSet rs = query("SELECT lastval()");
    if (rs.rows.empty() || rs.rows[0].empty() || !rs.rows[0][0]) {
        return 0;
    }
    return std::strtoull(rs.rows[0][0]->c_str(), nullptr, 10);
}

std::string PostgreSQLConnection::quote(const std::string& value) {
    // PQescapeLiteral returns a malloc'd string that includes quotes
    char* escaped = PQescapeLiteral(handle(), value.c_str(), value.size());
    if (!escaped) {
        fail(nullptr, "escape literal");
    }
    std::string result(escaped);
    PQfreemem(escaped);
    return result;
}

// ============================================================================
// Attributes and driver operations
// ============================================================================

SqlValue PostgreSQLConnection::attribute(const std::string& name) {
    if (name == "Name") return std::string(PQdb(handle()));
    if (name == "Driver") return driverName();
    if (name == "pg_server_version") return std::to_string(PQserverVersion(handle()));
    if (name == "pg_backend_pid") return std::to_string(PQbackendPID(handle()));
    if (name == "pg_transaction_status") {
        switch (PQtransactionStatus(handle())) {
            case PQTRANS_IDLE: return std::string("idle");
            case PQTRANS_ACTIVE: return std::string("active");
            case PQTRANS_INTRANS: return std::string("in transaction");
            case PQTRANS_INERROR: return std::string("in failed transaction");
            default: return std::string("unknown");
        }
    }
    return std::nullopt;
}

void PostgreSQLConnection::setAttribute(const std::string& name, const SqlValue& /*value*/) {
    throw UnsupportedOperation(driverName(), "set " + name);
}

SqlValue PostgreSQLConnection::invoke(const std::string& operation, const std::vector<std::string>& args) {
    if (operation == "quote_identifier") {
        if (args.size() != 1) {
            throw std::invalid_argument("quote_identifier() expects 1 argument");
        }
        char* escaped = PQescapeIdentifier(handle(), args[0].c_str(), args[0].size());
        if (!escaped) {
            fail(nullptr, "escape identifier");
        }
        std::string result(escaped);
        PQfreemem(escaped);
        return result;
    }
    if (operation == "backend_pid") {
        return std::to_string(PQbackendPID(handle()));
    }
    return Connection::invoke(operation, args);
}

// ============================================================================
// Helpers
// ============================================================================

PGconn* PostgreSQLConnection::handle() {
    if (!m_conn) {
        throw DriverError("PostgreSQL", CONNECTION_BAD, "No connection");
    }
    return m_conn;
}

void PostgreSQLConnection::fail(PGresult* result, const std::string& context) {
    ResultPtr owned(result);
    int64_t code = result ? static_cast<int64_t>(PQresultStatus(result)) : static_cast<int64_t>(PQstatus(m_conn));
    std::string msg = result ? PQresultErrorMessage(result) : PQerrorMessage(m_conn);
    throw DriverError("PostgreSQL", code, context + ": " + trimMessage(msg));
}

}  // namespace safedb
