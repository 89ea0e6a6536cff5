/**
 * @file MySQLConnection.cpp
 * @brief Physical MySQL connection over libmysqlclient.
 */

#include "MySQLConnection.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <mysql/errmsg.h>

namespace safedb {

namespace {

struct ResultDeleter {
    void operator()(MYSQL_RES* res) const { mysql_free_result(res); }
};
using ResultPtr = std::unique_ptr<MYSQL_RES, ResultDeleter>;

}  // namespace

// ============================================================================
// Construction and Destruction
// ============================================================================

MySQLConnection::MySQLConnection(const ConnectionConfig& config)
    : m_database(config.default_database) {

    // Initialize MySQL library (thread-safe)
    static std::once_flag mysqlInitFlag;
    std::call_once(mysqlInitFlag, []() {
        mysql_library_init(0, nullptr, nullptr);
    });

    m_conn = mysql_init(nullptr);
    if (!m_conn) {
        throw DriverError("MySQL", 0, "Failed to initialize MySQL connection");
    }

    // Set options
    unsigned int timeout = static_cast<unsigned int>(config.connect_timeout.count() / 1000);
    mysql_options(m_conn, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);

    unsigned int readTimeout = static_cast<unsigned int>(config.read_timeout.count() / 1000);
    mysql_options(m_conn, MYSQL_OPT_READ_TIMEOUT, &readTimeout);

    unsigned int writeTimeout = static_cast<unsigned int>(config.write_timeout.count() / 1000);
    mysql_options(m_conn, MYSQL_OPT_WRITE_TIMEOUT, &writeTimeout);

    // Reconnecting is the proxy's job
    bool reconnect = false;
    mysql_options(m_conn, MYSQL_OPT_RECONNECT, &reconnect);

    // SSL options
    if (config.use_ssl) {
        mysql_ssl_set(m_conn,
                      config.ssl_key.empty() ? nullptr : config.ssl_key.c_str(),
                      config.ssl_cert.empty() ? nullptr : config.ssl_cert.c_str(),
                      config.ssl_ca.empty() ? nullptr : config.ssl_ca.c_str(),
                      nullptr, nullptr);
    }

    // Connect
    const char* socket = config.socket.empty() ? nullptr : config.socket.c_str();
    const char* db = config.default_database.empty() ? nullptr : config.default_database.c_str();

    if (!mysql_real_connect(m_conn,
                            config.host.c_str(),
                            config.user.c_str(),
                            config.password.c_str(),
                            db,
                            config.port,
                            socket,
                            CLIENT_MULTI_STATEMENTS)) {
        unsigned int err = mysql_errno(m_conn);
        std::string msg = mysql_error(m_conn);
        mysql_close(m_conn);
        m_conn = nullptr;
        throw DriverError("MySQL", err, "Failed to connect to MySQL: " + msg);
    }

    // Set character set to UTF-8
    mysql_set_character_set(m_conn, "utf8mb4");

    spdlog::debug("Connected to MySQL {} (thread id {})", config.host, mysql_thread_id(m_conn));
}

MySQLConnection::~MySQLConnection() {
    if (!m_conn) {
        return;
    }
    if (inactiveDestroy()) {
        spdlog::debug("Leaving MySQL session {} open", mysql_thread_id(m_conn));
        return;
    }
    mysql_close(m_conn);
}

// ============================================================================
// Liveness
// ============================================================================

bool MySQLConnection::ping() {
    if (!m_conn) return false;
    // mysql_ping() returns 0 on success, non-zero on failure
    if (mysql_ping(m_conn) != 0) {
        spdlog::debug("MySQL ping failed: {}", mysql_error(m_conn));
        return false;
    }
    return true;
}

// ============================================================================
// Query Execution
// ============================================================================

void MySQLConnection::runQuery(const std::string& sql) {
    // mysql_real_query() is preferred over mysql_query() for binary safety
    if (mysql_real_query(handle(), sql.c_str(), sql.size()) != 0) {
        fail("query");
    }
}

uint64_t MySQLConnection::execute(const std::string& sql) {
    runQuery(sql);

    uint64_t affected = 0;
    int status = 0;
    // Drain every result of a multi-statement batch
    do {
        ResultPtr res(mysql_store_result(m_conn));
        if (!res && mysql_field_count(m_conn) != 0) {
            fail("store result");
        }
        if (!res) {
            affected += mysql_affected_rows(m_conn);
        }
        // 0 = more results, -1 = done, > 0 = a later statement failed
        status = mysql_next_result(m_conn);
        if (status > 0) {
            fail("next result");
        }
    } while (status == 0);

    return affected;
}

ResultSet MySQLConnection::query(const std::string& sql) {
    runQuery(sql);

    ResultSet result;
    ResultPtr res(mysql_store_result(m_conn));
    if (!res) {
        if (mysql_field_count(m_conn) != 0) {
            fail("store result");
        }
        return result;
    }

    unsigned int numFields = mysql_num_fields(res.get());
    MYSQL_FIELD* fields = mysql_fetch_fields(res.get());
    for (unsigned int i = 0; i < numFields; ++i) {
        result.columns.emplace_back(fields[i].name);
    }

    MYSQL_ROW row;
    while ((row = mysql_fetch_row(res.get()))) {
        unsigned long* lengths = mysql_fetch_lengths(res.get());
        std::vector<SqlValue> values;
        values.reserve(numFields);
        for (unsigned int i = 0; i < numFields; ++i) {
            if (row[i]) {
                values.emplace_back(std::string(row[i], lengths[i]));
            } else {
                values.emplace_back(std::nullopt);
            }
        }
        result.rows.push_back(std::move(values));
    }

    // Discard any further results so the session stays usable
    while (mysql_next_result(m_conn) == 0) {
        ResultPtr extra(mysql_store_result(m_conn));
    }

    return result;
}

// ============================================================================
// Transactions
// ============================================================================

void MySQLConnection::begin() {
    runQuery("START TRANSACTION");
}

void MySQLConnection::commit() {
    if (mysql_commit(handle()) != 0) {
        fail("commit");
    }
}

void MySQLConnection::rollback() {
    if (mysql_rollback(handle()) != 0) {
        fail("rollback");
    }
}

// ============================================================================
// Metadata
// ============================================================================

std::vector<std::string> MySQLConnection::tables() {
    ResultSet rs = query(
        "SELECT TABLE_NAME FROM information_schema.TABLES "
        "WHERE TABLE_SCHEMA = DATABASE() AND TABLE_TYPE = 'BASE TABLE' "
        "ORDER BY TABLE_NAME");

    std::vector<std::string> names;
    for (const auto& row : rs.rows) {
        if (!row.empty() && row[0]) {
            names.push_back(*row[0]);
        }
    }
    return names;
}

std::vector<ColumnInfo> MySQLConnection::columns(const std::string& table) {
    ResultSet rs = query(
        "SELECT COLUMN_NAME, COLUMN_TYPE, IS_NULLABLE, COLUMN_KEY "
        "FROM information_schema.COLUMNS "
        "WHERE TABLE_SCHEMA = DATABASE() AND TABLE_NAME = " + quote(table) +
        " ORDER BY ORDINAL_POSITION");

    std::vector<ColumnInfo> result;
    for (const auto& row : rs.rows) {
        if (row.size() < 4) continue;
        ColumnInfo col;
        col.name = row[0].value_or("");
        col.type = row[1].value_or("");
        col.nullable = row[2].value_or("YES") == "YES";
        col.primary_key = row[3].value_or("") == "PRI";
        result.push_back(std::move(col));
    }
    return result;
}

uint64_t MySQLConnection::lastInsertId() {
    return mysql_insert_id(handle());
}

std::string MySQLConnection::quote(const std::string& value) {
    std::string escaped(value.size() * 2 + 1, '\0');
    unsigned long len = mysql_real_escape_string(handle(), &escaped[0], value.c_str(), value.size());
    escaped.resize(len);
    return "'" + escaped + "'";
}

// ============================================================================
// Attributes and driver operations
// ============================================================================

SqlValue MySQLConnection::attribute(const std::string& name) {
    if (name == "Name") return m_database;
    if (name == "Driver") return driverName();
    if (name == "mysql_serverinfo") return std::string(mysql_get_server_info(handle()));
    if (name == "mysql_hostinfo") return std::string(mysql_get_host_info(handle()));
    if (name == "mysql_thread_id") return std::to_string(mysql_thread_id(handle()));
    return std::nullopt;
}

void MySQLConnection::setAttribute(const std::string& name, const SqlValue& /*value*/) {
    throw UnsupportedOperation(driverName(), "set " + name);
}

SqlValue MySQLConnection::invoke(const std::string& operation, const std::vector<std::string>& args) {
    if (operation == "select_db") {
        if (args.size() != 1) {
            throw std::invalid_argument("select_db() expects 1 argument");
        }
        if (mysql_select_db(handle(), args[0].c_str()) != 0) {
            fail("select_db");
        }
        m_database = args[0];
        return m_database;
    }
    if (operation == "thread_id") {
        return std::to_string(mysql_thread_id(handle()));
    }
    return Connection::invoke(operation, args);
}

// ============================================================================
// Helpers
// ============================================================================

MYSQL* MySQLConnection::handle() {
    if (!m_conn) {
        throw DriverError("MySQL", CR_CONNECTION_ERROR, "No connection");
    }
    return m_conn;
}

void MySQLConnection::fail(const std::string& context) {
    throw DriverError("MySQL", mysql_errno(m_conn), context + ": " + mysql_error(m_conn));
}

}  // namespace safedb
