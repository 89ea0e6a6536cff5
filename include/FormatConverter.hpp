#pragma once

#include "Connection.hpp"
#include "Config.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace safedb {

using json = nlohmann::json;

struct CSVOptions {
    char delimiter = ',';
    char quote = '"';
    std::string lineEnding = "\n";
    bool includeHeader = true;
    bool quoteAll = false;
};

struct JSONOptions {
    bool pretty = true;
    int indent = 2;
    bool includeNull = true;
};

struct TableOptions {
    std::string nullText = "NULL";
    size_t maxColumnWidth = 40;  // longer values are cut and end in "..."
};

// Renders query results for the shell
class FormatConverter {
public:
    static std::string toCSV(const ResultSet& result, const CSVOptions& options = CSVOptions{});

    // Array of objects keyed by column name
    static std::string toJSON(const ResultSet& result, const JSONOptions& options = JSONOptions{});

    /**
     * @brief Aligned text table with a header rule and a row count footer.
     *
     * @code
     *   id | name
     *   ---+------
     *   1  | alice
     *   (1 row)
     * @endcode
     */
    static std::string toTable(const ResultSet& result, const TableOptions& options = TableOptions{});

    // Render in the format named by the output configuration
    static std::string format(const ResultSet& result, const OutputConfig& output);

    // Column metadata as a result set (name, type, nullable, key)
    static ResultSet describeColumns(const std::vector<ColumnInfo>& columns);

    static std::string escapeCSVField(const std::string& field,
                                      const CSVOptions& options = CSVOptions{});
};

}  // namespace safedb
