#include "Shell.hpp"
#include "ErrorHandler.hpp"
#include "FormatConverter.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>
#include <stdexcept>

namespace safedb {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string firstWord(const std::string& sql) {
    std::string word;
    for (char c : sql) {
        if (std::isspace(static_cast<unsigned char>(c)) || c == '(') break;
        word += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return word;
}

}  // namespace

Shell::Shell(SafeConnection& db, OutputConfig output, std::ostream& out, std::ostream& err)
    : m_db(db)
    , m_output(std::move(output))
    , m_out(out)
    , m_err(err) {
}

bool Shell::runLine(const std::string& line) {
    std::string statement = trim(line);
    if (statement.empty() || statement[0] == '#' || statement.compare(0, 2, "--") == 0) {
        return true;
    }

    try {
        if (statement[0] == '\\') {
            auto space = statement.find_first_of(" \t");
            std::string command = statement.substr(1, space == std::string::npos ? std::string::npos : space - 1);
            std::string argument = space == std::string::npos ? "" : trim(statement.substr(space));
            runMeta(command, argument);
        } else {
            while (!statement.empty() && statement.back() == ';') {
                statement.pop_back();
            }
            runStatement(trim(statement));
        }
        return true;
    } catch (const std::exception& e) {
        m_err << "Error: " << ErrorHandler::describe(e) << std::endl;
        spdlog::debug("Statement failed: {}", statement);
        return false;
    }
}

int Shell::runScript(std::istream& in) {
    int failures = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (!runLine(line)) {
            ++failures;
        }
    }
    return failures;
}

bool Shell::isQuery(const std::string& sql) {
    static const char* const kQueryWords[] = {
        "SELECT", "WITH", "PRAGMA", "SHOW", "EXPLAIN", "VALUES", "DESCRIBE"
    };
    std::string word = firstWord(trim(sql));
    return std::any_of(std::begin(kQueryWords), std::end(kQueryWords),
                       [&word](const char* query) { return word == query; });
}

void Shell::runMeta(const std::string& command, const std::string& argument) {
    if (command == "begin") {
        m_db.begin();
        m_out << "BEGIN" << std::endl;
    } else if (command == "commit") {
        m_db.commit();
        m_out << "COMMIT" << std::endl;
    } else if (command == "rollback") {
        m_db.rollback();
        m_out << "ROLLBACK" << std::endl;
    } else if (command == "ping") {
        m_out << (m_db.ping() ? "alive" : "dead") << std::endl;
    } else if (command == "tables") {
        ResultSet result;
        result.columns = {"table"};
        for (const auto& table : m_db.tables()) {
            result.rows.push_back({table});
        }
        m_out << FormatConverter::format(result, m_output);
    } else if (command == "columns") {
        if (argument.empty()) {
            throw std::invalid_argument("\\columns needs a table name");
        }
        m_out << FormatConverter::format(FormatConverter::describeColumns(m_db.columns(argument)), m_output);
    } else if (command == "status") {
        printStatus();
    } else if (command == "reconnect") {
        m_db.disconnect();
        m_out << "Disconnected; the next statement reconnects" << std::endl;
    } else {
        throw std::invalid_argument("Unknown command: \\" + command);
    }
}

void Shell::runStatement(const std::string& sql) {
    if (isQuery(sql)) {
        m_out << FormatConverter::format(m_db.query(sql), m_output);
    } else {
        uint64_t affected = m_db.execute(sql);
        m_out << "OK, " << affected << (affected == 1 ? " row" : " rows") << " affected" << std::endl;
    }
}

void Shell::printStatus() {
    ResultSet result;
    result.columns = {"attribute", "value"};
    for (const char* name : {"Active", "AutoCommit", "x_safe_in_transaction",
                             "x_safe_reconnect_count", "x_safe_last_connected",
                             "x_safe_last_error"}) {
        result.rows.push_back({std::string(name), m_db.attribute(name)});
    }
    m_out << FormatConverter::format(result, m_output);
}

}  // namespace safedb
