#include "Config.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <cstdlib>
#include <algorithm>
#include <cctype>

namespace safedb {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

bool parseBool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes" || value == "on";
}

void applyConnection(Config& config, const std::string& key, const std::string& value) {
    if (key == "host") config.connection.host = value;
    else if (key == "port") config.connection.port = static_cast<uint16_t>(std::stoi(value));
    else if (key == "user") config.connection.user = value;
    else if (key == "password") config.connection.password = value;
    else if (key == "socket") config.connection.socket = value;
    else if (key == "database" || key == "default_database") config.connection.default_database = value;
    else if (key == "use_ssl") config.connection.use_ssl = parseBool(value);
    else if (key == "ssl_ca") config.connection.ssl_ca = value;
    else if (key == "ssl_cert") config.connection.ssl_cert = value;
    else if (key == "ssl_key") config.connection.ssl_key = value;
    else if (key == "connect_timeout")
        config.connection.connect_timeout = std::chrono::milliseconds(std::stoi(value));
    else if (key == "read_timeout")
        config.connection.read_timeout = std::chrono::milliseconds(std::stoi(value));
    else if (key == "write_timeout")
        config.connection.write_timeout = std::chrono::milliseconds(std::stoi(value));
}

void applyReconnect(Config& config, const std::string& key, const std::string& value) {
    if (key == "max_attempts") config.reconnect.max_attempts = std::stoi(value);
    else if (key == "retry_delay")
        config.reconnect.retry_delay = std::chrono::milliseconds(std::stoi(value));
    else if (key == "backoff_multiplier") config.reconnect.backoff_multiplier = std::stod(value);
    else if (key == "max_delay")
        config.reconnect.max_delay = std::chrono::milliseconds(std::stoi(value));
    else if (key == "reconnect_period")
        config.reconnect.reconnect_period = std::chrono::seconds(std::stoi(value));
}

}  // namespace

std::optional<Config> Config::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;
    std::string current_section;
    int line_number = 0;

    while (std::getline(file, line)) {
        ++line_number;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = toLower(trim(line.substr(1, line.size() - 2)));
            continue;
        }

        // Key-value pair
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        try {
            if (current_section == "database") {
                if (key == "type") config.database_type = toLower(value);
                else if (key == "dsn") config.dsn = value;
            }
            else if (current_section == "connection") {
                applyConnection(config, key, value);
            }
            else if (current_section == "reconnect") {
                applyReconnect(config, key, value);
            }
            else if (current_section == "logging") {
                if (key == "level") config.logging.level = toLower(value);
                else if (key == "file") config.logging.log_file = value;
            }
            else if (current_section == "output") {
                if (key == "format") config.output.format = toLower(value);
                else if (key == "pretty_json") config.output.pretty_json = parseBool(value);
                else if (key == "include_csv_header") config.output.include_csv_header = parseBool(value);
            }
        } catch (const std::exception& e) {
            spdlog::warn("{}:{}: ignoring invalid value '{}' for '{}': {}",
                         path.string(), line_number, value, key, e.what());
        }
    }

    return config;
}

Config Config::parseArgs(int argc, char* argv[]) {
    Config config;

    CLI::App app{"safedb-shell - run SQL through a self-healing database connection"};

    // Config file, applied first so command line options override it
    std::string config_file;
    app.add_option("-c,--config", config_file, "Path to configuration file");

    std::string database_type;
    app.add_option("-t,--type", database_type, "Database type (sqlite, mysql, postgresql)");
    std::string dsn;
    app.add_option("--dsn", dsn, "Connection string, e.g. sqlite:/tmp/app.db");

    // Connection options
    std::string host;
    app.add_option("-H,--host", host, "Database server host");
    uint16_t port = 0;
    app.add_option("-P,--port", port, "Database server port");
    std::string user;
    app.add_option("-u,--user", user, "Database username");
    std::string password;
    app.add_option("-p,--password", password, "Database password");
    std::string socket;
    app.add_option("-S,--socket", socket, "Unix socket path");
    std::string database;
    app.add_option("-D,--database", database, "Database name (or SQLite file path)");
    bool use_ssl = false;
    app.add_flag("--ssl", use_ssl, "Enable SSL connection");

    // Reconnect options
    int max_attempts = 0;
    app.add_option("--max-attempts", max_attempts, "Connection attempts per reconnect");
    int retry_delay_ms = -1;
    app.add_option("--retry-delay", retry_delay_ms, "Delay before a repeated attempt, in ms");
    double backoff = 0.0;
    app.add_option("--backoff", backoff, "Multiplier applied to the delay after each attempt");
    int reconnect_period = -1;
    app.add_option("--reconnect-period", reconnect_period,
                   "Force a reconnect after this many seconds (0 = never)");

    // Statements
    std::vector<std::string> statements;
    app.add_option("-e,--execute", statements, "Statement to run (repeatable)");
    std::string script_file;
    app.add_option("-f,--file", script_file, "Script file with one statement per line");

    // Output and logging
    std::string format;
    app.add_option("-o,--output", format, "Output format (table, csv, json)");
    std::string log_file;
    app.add_option("--log-file", log_file, "Write logs to this file as well");
    bool debug = false;
    app.add_flag("-d,--debug", debug, "Enable debug output");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    if (!config_file.empty()) {
        auto file_config = loadFromFile(config_file);
        if (file_config) {
            config = *file_config;
        } else {
            spdlog::warn("Could not load config file: {}", config_file);
        }
    }

    // Command line args override file config
    if (!database_type.empty()) config.database_type = toLower(database_type);
    if (!dsn.empty()) config.dsn = dsn;
    if (!host.empty()) config.connection.host = host;
    if (port != 0) config.connection.port = port;
    if (!user.empty()) config.connection.user = user;
    if (!password.empty()) config.connection.password = password;
    if (!socket.empty()) config.connection.socket = socket;
    if (!database.empty()) config.connection.default_database = database;
    if (use_ssl) config.connection.use_ssl = true;
    if (max_attempts > 0) config.reconnect.max_attempts = max_attempts;
    if (retry_delay_ms >= 0) config.reconnect.retry_delay = std::chrono::milliseconds(retry_delay_ms);
    if (backoff > 0.0) config.reconnect.backoff_multiplier = backoff;
    if (reconnect_period >= 0) config.reconnect.reconnect_period = std::chrono::seconds(reconnect_period);
    if (!format.empty()) config.output.format = toLower(format);
    if (!log_file.empty()) config.logging.log_file = log_file;
    if (!script_file.empty()) config.script_file = script_file;
    if (debug) {
        config.debug = true;
        config.logging.level = "debug";
    }
    config.statements.insert(config.statements.end(), statements.begin(), statements.end());

    // Resolve password from environment if not set
    config.resolvePassword();

    return config;
}

bool Config::validate() const {
    std::optional<DatabaseType> type;
    if (dsn.empty()) {
        type = parseDatabaseType(database_type);
        if (!type) {
            spdlog::error("Unknown database type: {}", database_type);
            return false;
        }

        if (*type == DatabaseType::SQLite && connection.default_database.empty()) {
            spdlog::error("SQLite database file is required (use -D option)");
            return false;
        }

        if (*type == DatabaseType::MySQL && connection.user.empty()) {
            spdlog::error("Database username is required (use -u option)");
            return false;
        }
    }

    if (reconnect.max_attempts < 1) {
        spdlog::error("max_attempts must be at least 1");
        return false;
    }

    if (reconnect.backoff_multiplier < 1.0) {
        spdlog::error("backoff_multiplier must be at least 1.0");
        return false;
    }

    if (reconnect.retry_delay.count() < 0 || reconnect.reconnect_period.count() < 0) {
        spdlog::error("Reconnect delays must not be negative");
        return false;
    }

    if (output.format != "table" && output.format != "csv" && output.format != "json") {
        spdlog::error("Unknown output format: {}", output.format);
        return false;
    }

    if (!script_file.empty() && !std::filesystem::exists(script_file)) {
        spdlog::error("Script file not found: {}", script_file);
        return false;
    }

    if (connection.use_ssl) {
        if (!connection.ssl_ca.empty() && !std::filesystem::exists(connection.ssl_ca)) {
            spdlog::error("SSL CA file not found: {}", connection.ssl_ca);
            return false;
        }
        if (!connection.ssl_cert.empty() && !std::filesystem::exists(connection.ssl_cert)) {
            spdlog::error("SSL certificate file not found: {}", connection.ssl_cert);
            return false;
        }
        if (!connection.ssl_key.empty() && !std::filesystem::exists(connection.ssl_key)) {
            spdlog::error("SSL key file not found: {}", connection.ssl_key);
            return false;
        }
    }

    return true;
}

void Config::resolvePassword() {
    if (!connection.password.empty()) {
        return;
    }

    auto type = parseDatabaseType(database_type);
    const char* variable = (type && *type == DatabaseType::PostgreSQL) ? "PGPASSWORD" : "MYSQL_PWD";
    const char* env_pwd = std::getenv(variable);
    if (env_pwd) {
        connection.password = env_pwd;
    }
}

std::optional<DatabaseType> Config::parseDatabaseType(const std::string& name) {
    std::string lower = toLower(name);
    if (lower == "sqlite" || lower == "sqlite3") return DatabaseType::SQLite;
    if (lower == "mysql" || lower == "mariadb") return DatabaseType::MySQL;
    if (lower == "postgresql" || lower == "postgres" || lower == "pg") return DatabaseType::PostgreSQL;
    return std::nullopt;
}

}  // namespace safedb
