#pragma once

/**
 * @file Shell.hpp
 * @brief Line-oriented SQL client on top of a SafeConnection.
 *
 * Each input line is one statement or one meta command:
 *
 *   \begin  \commit  \rollback    transaction control
 *   \ping                          check the connection
 *   \tables  \columns <table>      metadata
 *   \status                        proxy bookkeeping
 *   \reconnect                     drop the connection; the next statement reconnects
 *
 * Empty lines and lines starting with "--" or "#" are skipped.
 */

#include "Config.hpp"
#include "SafeConnection.hpp"
#include <iosfwd>
#include <string>

namespace safedb {

class Shell {
public:
    Shell(SafeConnection& db, OutputConfig output, std::ostream& out, std::ostream& err);

    /**
     * @brief Run one statement or meta command.
     * @return false if it failed; the error has been written to err.
     */
    bool runLine(const std::string& line);

    /**
     * @brief Run every line of a script.
     * @return Number of failed lines.
     */
    int runScript(std::istream& in);

    // SELECT-like statements are run as queries and print rows
    static bool isQuery(const std::string& sql);

private:
    void runMeta(const std::string& command, const std::string& argument);
    void runStatement(const std::string& sql);
    void printStatus();

    SafeConnection& m_db;
    OutputConfig m_output;
    std::ostream& m_out;
    std::ostream& m_err;
};

}  // namespace safedb
