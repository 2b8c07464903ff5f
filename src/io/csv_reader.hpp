#ifndef LOADSIM_CSV_READER_HPP
#define LOADSIM_CSV_READER_HPP

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace loadsim {

// Line-oriented CSV reader. Cells are trimmed; double-quoted cells may
// contain the delimiter and "" as an escaped quote.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    std::vector<std::string> read_row();
    bool has_more() const;

    // 1-based number of the last line returned by read_row()
    size_t line_number() const { return line_number_; }

private:
    std::istream& is_;
    char delimiter_;
    size_t line_number_;

    std::vector<std::string> split(const std::string& line) const;
    static std::string trim(const std::string& s);
};

// Parse helpers that report the offending cell instead of std::stod's bare message
double parse_double(const std::string& cell, const std::string& context);
long long parse_integer(const std::string& cell, const std::string& context);

} // namespace loadsim

#endif // LOADSIM_CSV_READER_HPP
