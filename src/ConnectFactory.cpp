#include "ConnectFactory.hpp"
#include "ErrorHandler.hpp"
#include "sqlite/SQLiteConnection.hpp"
#include "mysql/MySQLConnection.hpp"
#include "postgresql/PostgreSQLConnection.hpp"
#include <spdlog/spdlog.h>

namespace safedb {

namespace {

bool startsWith(const std::string& str, const std::string& prefix) {
    return str.compare(0, prefix.size(), prefix) == 0;
}

std::string sqlitePath(const std::string& dsn) {
    std::string path = dsn.substr(std::string("sqlite:").size());
    if (startsWith(path, "//")) {
        path = path.substr(2);
    }
    return path;
}

// Rejects what no retry could fix, before any connect is attempted
void validateDsn(const DsnArgs& args) {
    const std::string& dsn = args.dsn;
    if (startsWith(dsn, "sqlite:")) {
        if (sqlitePath(dsn).empty()) {
            throw ConfigurationError("SQLite DSN without a database path: " + dsn);
        }
        return;
    }
    if (startsWith(dsn, "mysql://")) {
        ConnectFactoryAdapter::parseMySQLUri(dsn);
        return;
    }
    if (startsWith(dsn, "postgresql://") || startsWith(dsn, "postgres://")) {
        return;
    }
    throw ConfigurationError("Unsupported DSN scheme: " + dsn);
}

}  // namespace

ConnectFactory ConnectFactoryAdapter::resolve(const ConnectFactory& factory,
                                              const std::optional<DsnArgs>& dsnArgs) {
    if (factory) {
        return factory;
    }
    if (dsnArgs) {
        return fromDsn(*dsnArgs);
    }
    throw ConfigurationError("No connect way defined");
}

ConnectFactory ConnectFactoryAdapter::fromDsn(DsnArgs args) {
    if (args.dsn.empty()) {
        throw ConfigurationError("Empty DSN");
    }
    validateDsn(args);
    return [args = std::move(args)]() { return connectDsn(args); };
}

ConnectFactory ConnectFactoryAdapter::fromConfig(const std::string& databaseType,
                                                 const ConnectionConfig& config) {
    auto type = Config::parseDatabaseType(databaseType);
    if (!type) {
        throw ConfigurationError("Unknown database type: " + databaseType);
    }
    return [type = *type, config]() { return connect(type, config); };
}

std::unique_ptr<Connection> ConnectFactoryAdapter::connectDsn(const DsnArgs& args) {
    const std::string& dsn = args.dsn;

    if (startsWith(dsn, "sqlite:")) {
        std::string path = sqlitePath(dsn);
        if (path.empty()) {
            throw ConfigurationError("SQLite DSN without a database path: " + dsn);
        }
        return std::make_unique<SQLiteConnection>(path);
    }

    if (startsWith(dsn, "mysql://")) {
        ConnectionConfig config = parseMySQLUri(dsn);
        if (!args.user.empty()) config.user = args.user;
        if (!args.password.empty()) config.password = args.password;
        return std::make_unique<MySQLConnection>(config);
    }

    if (startsWith(dsn, "postgresql://") || startsWith(dsn, "postgres://")) {
        return std::make_unique<PostgreSQLConnection>(dsn, args.user, args.password);
    }

    throw ConfigurationError("Unsupported DSN scheme: " + dsn);
}

std::unique_ptr<Connection> ConnectFactoryAdapter::connect(DatabaseType type,
                                                           const ConnectionConfig& config) {
    switch (type) {
        case DatabaseType::SQLite:
            return std::make_unique<SQLiteConnection>(config.default_database);
        case DatabaseType::MySQL:
            return std::make_unique<MySQLConnection>(config);
        case DatabaseType::PostgreSQL:
            return std::make_unique<PostgreSQLConnection>(config);
    }
    throw ConfigurationError("Unknown database type");
}

ConnectionConfig ConnectFactoryAdapter::parseMySQLUri(const std::string& uri) {
    const std::string scheme = "mysql://";
    if (!startsWith(uri, scheme)) {
        throw ConfigurationError("Not a mysql:// URI: " + uri);
    }

    ConnectionConfig config;
    std::string rest = uri.substr(scheme.size());

    // Query parameters are not interpreted
    auto query_pos = rest.find('?');
    if (query_pos != std::string::npos) {
        spdlog::debug("Ignoring MySQL URI parameters: {}", rest.substr(query_pos + 1));
        rest = rest.substr(0, query_pos);
    }

    auto at_pos = rest.rfind('@');
    if (at_pos != std::string::npos) {
        std::string credentials = rest.substr(0, at_pos);
        rest = rest.substr(at_pos + 1);

        auto colon_pos = credentials.find(':');
        if (colon_pos != std::string::npos) {
            config.user = credentials.substr(0, colon_pos);
            config.password = credentials.substr(colon_pos + 1);
        } else {
            config.user = credentials;
        }
    }

    auto slash_pos = rest.find('/');
    if (slash_pos != std::string::npos) {
        config.default_database = rest.substr(slash_pos + 1);
        rest = rest.substr(0, slash_pos);
    }

    auto port_pos = rest.rfind(':');
    if (port_pos != std::string::npos) {
        std::string port = rest.substr(port_pos + 1);
        rest = rest.substr(0, port_pos);
        try {
            int value = std::stoi(port);
            if (value <= 0 || value > 65535) {
                throw std::out_of_range(port);
            }
            config.port = static_cast<uint16_t>(value);
        } catch (const std::exception&) {
            throw ConfigurationError("Invalid port in MySQL URI: " + port);
        }
    }

    if (!rest.empty()) {
        config.host = rest;
    }

    return config;
}

}  // namespace safedb
