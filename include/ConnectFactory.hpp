#pragma once

/**
 * @file ConnectFactory.hpp
 * @brief Turns caller configuration into a "produce a live connection" call.
 */

#include "Connection.hpp"
#include "Config.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace safedb {

// Produces a new live physical connection or throws
using ConnectFactory = std::function<std::unique_ptr<Connection>()>;

/**
 * @struct DsnArgs
 * @brief Arguments for connecting by connection string.
 *
 * Supported schemes:
 * - sqlite:<path>, sqlite://<path>, sqlite::memory:
 * - mysql://[user[:password]@]host[:port][/database]
 * - postgresql://... or postgres://... (handed to libpq as is)
 *
 * Non-empty user/password override credentials embedded in the DSN.
 */
struct DsnArgs {
    std::string dsn;
    std::string user;
    std::string password;
};

class ConnectFactoryAdapter {
public:
    /**
     * @brief Pick the connect mechanism: explicit factory first, then DSN.
     * @throws ConfigurationError if neither is supplied.
     */
    static ConnectFactory resolve(const ConnectFactory& factory,
                                  const std::optional<DsnArgs>& dsnArgs);

    /**
     * @brief Factory connecting through a DSN.
     * @throws ConfigurationError for an empty DSN, an unsupported scheme or a
     *         malformed SQLite path or MySQL URI.
     */
    static ConnectFactory fromDsn(DsnArgs args);

    /**
     * @brief Factory for a database type name and connection parameters.
     * @throws ConfigurationError for an unknown database type.
     */
    static ConnectFactory fromConfig(const std::string& databaseType,
                                     const ConnectionConfig& config);

    // Connect once through the backend matching the DSN scheme
    static std::unique_ptr<Connection> connectDsn(const DsnArgs& args);

    static std::unique_ptr<Connection> connect(DatabaseType type, const ConnectionConfig& config);

    // Parse the mysql:// form into connection parameters
    static ConnectionConfig parseMySQLUri(const std::string& uri);
};

}  // namespace safedb
