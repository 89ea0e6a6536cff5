#include "FormatConverter.hpp"
#include <sstream>
#include <algorithm>

namespace safedb {

namespace {

std::string clip(const std::string& value, size_t width) {
    if (width < 4 || value.size() <= width) {
        return value;
    }
    return value.substr(0, width - 3) + "...";
}

}  // namespace

std::string FormatConverter::toCSV(const ResultSet& result, const CSVOptions& options) {
    std::ostringstream out;

    // Header
    if (options.includeHeader) {
        for (size_t i = 0; i < result.columns.size(); ++i) {
            if (i > 0) out << options.delimiter;
            out << escapeCSVField(result.columns[i], options);
        }
        out << options.lineEnding;
    }

    // Rows; NULL is an empty field
    for (const auto& row : result.rows) {
        for (size_t i = 0; i < row.size(); ++i) {
            if (i > 0) out << options.delimiter;

            if (row[i].has_value()) {
                out << escapeCSVField(row[i].value(), options);
            }
        }
        out << options.lineEnding;
    }

    return out.str();
}

std::string FormatConverter::toJSON(const ResultSet& result, const JSONOptions& options) {
    json arr = json::array();

    for (const auto& row : result.rows) {
        json obj = json::object();

        for (size_t i = 0; i < std::min(result.columns.size(), row.size()); ++i) {
            if (row[i].has_value()) {
                obj[result.columns[i]] = row[i].value();
            } else if (options.includeNull) {
                obj[result.columns[i]] = nullptr;
            }
        }

        arr.push_back(std::move(obj));
    }

    return options.pretty ? arr.dump(options.indent) : arr.dump();
}

std::string FormatConverter::toTable(const ResultSet& result, const TableOptions& options) {
    std::ostringstream out;

    if (result.columns.empty()) {
        return out.str();
    }

    std::vector<std::vector<std::string>> cells;
    cells.reserve(result.rows.size());
    for (const auto& row : result.rows) {
        std::vector<std::string> line;
        for (size_t i = 0; i < result.columns.size(); ++i) {
            std::string value = (i < row.size() && row[i]) ? *row[i] : options.nullText;
            line.push_back(clip(value, options.maxColumnWidth));
        }
        cells.push_back(std::move(line));
    }

    std::vector<size_t> widths;
    for (const auto& column : result.columns) {
        widths.push_back(clip(column, options.maxColumnWidth).size());
    }
    for (const auto& line : cells) {
        for (size_t i = 0; i < line.size(); ++i) {
            widths[i] = std::max(widths[i], line[i].size());
        }
    }

    auto writeLine = [&](const std::vector<std::string>& values) {
        for (size_t i = 0; i < values.size(); ++i) {
            if (i > 0) out << " | ";
            out << values[i];
            // No trailing padding on the last column
            if (i + 1 < values.size()) {
                out << std::string(widths[i] - values[i].size(), ' ');
            }
        }
        out << "\n";
    };

    std::vector<std::string> header;
    for (const auto& column : result.columns) {
        header.push_back(clip(column, options.maxColumnWidth));
    }
    writeLine(header);

    for (size_t i = 0; i < widths.size(); ++i) {
        if (i > 0) out << "-+-";
        out << std::string(widths[i], '-');
    }
    out << "\n";

    for (const auto& line : cells) {
        writeLine(line);
    }

    out << "(" << result.rows.size() << (result.rows.size() == 1 ? " row)" : " rows)") << "\n";
    return out.str();
}

std::string FormatConverter::format(const ResultSet& result, const OutputConfig& output) {
    if (output.format == "csv") {
        CSVOptions options;
        options.includeHeader = output.include_csv_header;
        return toCSV(result, options);
    }
    if (output.format == "json") {
        JSONOptions options;
        options.pretty = output.pretty_json;
        return toJSON(result, options) + "\n";
    }
    return toTable(result);
}

ResultSet FormatConverter::describeColumns(const std::vector<ColumnInfo>& columns) {
    ResultSet result;
    result.columns = {"name", "type", "nullable", "key"};
    for (const auto& col : columns) {
        result.rows.push_back({col.name, col.type,
                               std::string(col.nullable ? "YES" : "NO"),
                               std::string(col.primary_key ? "PRI" : "")});
    }
    return result;
}

std::string FormatConverter::escapeCSVField(const std::string& field,
                                            const CSVOptions& options) {
    bool needs_quoting = options.quoteAll;

    if (!needs_quoting) {
        for (char c : field) {
            if (c == options.delimiter || c == options.quote ||
                c == '\n' || c == '\r') {
                needs_quoting = true;
                break;
            }
        }
    }

    if (!needs_quoting) {
        return field;
    }

    std::string result;
    result.reserve(field.size() + 2);
    result += options.quote;

    for (char c : field) {
        if (c == options.quote) {
            result += options.quote;  // Double the quote
        }
        result += c;
    }

    result += options.quote;
    return result;
}

}  // namespace safedb
