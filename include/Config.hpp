#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <optional>
#include <filesystem>

namespace safedb {

enum class DatabaseType {
    SQLite,
    MySQL,
    PostgreSQL
};

struct ConnectionConfig {
    std::string host = "localhost";
    uint16_t port = 0;  // 0 = driver default
    std::string user;
    std::string password;
    std::string socket;
    std::string default_database;  // database name, or file path for SQLite

    // SSL options
    bool use_ssl = false;
    std::string ssl_ca;
    std::string ssl_cert;
    std::string ssl_key;

    // Timeouts
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds read_timeout{30000};
    std::chrono::milliseconds write_timeout{30000};
};

struct ReconnectConfig {
    int max_attempts = 1;
    std::chrono::milliseconds retry_delay{0};
    double backoff_multiplier = 1.0;
    std::chrono::milliseconds max_delay{30000};
    std::chrono::seconds reconnect_period{0};  // 0 = no time-based reconnect
};

struct LoggingConfig {
    std::string level = "info";  // trace, debug, info, warn, error
    std::string log_file;        // empty = console only
};

struct OutputConfig {
    std::string format = "table";  // table, csv, json
    bool pretty_json = true;
    bool include_csv_header = true;
};

struct Config {
    ConnectionConfig connection;
    ReconnectConfig reconnect;
    LoggingConfig logging;
    OutputConfig output;

    std::string database_type = "sqlite";  // sqlite, mysql, postgresql
    std::string dsn;                       // takes precedence over database_type
    std::vector<std::string> statements;   // -e statements, run in order
    std::string script_file;
    bool debug = false;

    // Load from file
    static std::optional<Config> loadFromFile(const std::filesystem::path& path);

    // Parse command line arguments
    static Config parseArgs(int argc, char* argv[]);

    // Validate configuration
    bool validate() const;

    // Get password from environment if not set
    void resolvePassword();

    static std::optional<DatabaseType> parseDatabaseType(const std::string& name);
};

}  // namespace safedb
