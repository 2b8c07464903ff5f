#include "csv_reader.hpp"
#include "../errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace loadsim {

CsvReader::CsvReader(std::istream& is, char delimiter)
    : is_(is), delimiter_(delimiter), line_number_(0) {}

std::vector<std::string> CsvReader::read_row() {
    std::string line;

    if (!std::getline(is_, line)) {
        return {};
    }
    ++line_number_;

    // Tolerate CRLF files and a UTF-8 byte order mark on the first line
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (line_number_ == 1 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        line.erase(0, 3);
    }

    return split(line);
}

bool CsvReader::has_more() const {
    return is_.good() && is_.peek() != EOF;
}

std::vector<std::string> CsvReader::split(const std::string& line) const {
    std::vector<std::string> row;
    if (line.empty()) {
        return row;
    }

    std::string cell;
    bool in_quotes = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    cell += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                cell += c;
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == delimiter_) {
            row.push_back(trim(cell));
            cell.clear();
        } else {
            cell += c;
        }
    }
    row.push_back(trim(cell));

    return row;
}

std::string CsvReader::trim(const std::string& s) {
    auto start = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

double parse_double(const std::string& cell, const std::string& context) {
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(cell, &consumed);
    } catch (const std::exception&) {
        throw DataError(context + ": '" + cell + "' is not a number");
    }
    if (consumed != cell.size() || !std::isfinite(value)) {
        throw DataError(context + ": '" + cell + "' is not a number");
    }
    return value;
}

long long parse_integer(const std::string& cell, const std::string& context) {
    // Accept "10" and "10.0" (spreadsheet exports), reject "10.5"
    double value = parse_double(cell, context);
    if (std::floor(value) != value) {
        throw DataError(context + ": '" + cell + "' is not a whole number");
    }
    // 2^63 is exact as a double; anything at or beyond it cannot be cast
    if (value < static_cast<double>(std::numeric_limits<long long>::min()) ||
        value >= 9223372036854775808.0) {
        throw DataError(context + ": '" + cell + "' is out of range");
    }
    return static_cast<long long>(value);
}

} // namespace loadsim
