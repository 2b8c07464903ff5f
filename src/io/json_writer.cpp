#include "json_writer.hpp"
#include "csv_writer.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace loadsim {
namespace io {

namespace {

struct Layout {
    std::string indent;
    std::string newline;
    std::string space;
};

template <typename Table, typename WriteCell>
void write_table(std::ostream& os, const Layout& l, const std::string& name, const Table& table,
                 WriteCell write_cell, bool last) {
    os << l.indent << "\"" << name << "\":" << l.space << "{" << l.newline;
    for (size_t m = 0; m < MONTHS_PER_YEAR; ++m) {
        os << l.indent << l.indent << "\"" << month_name(m) << "\":" << l.space << "[";
        for (size_t h = 0; h < HOURS_PER_DAY; ++h) {
            if (h > 0) {
                os << "," << l.space;
            }
            write_cell(table[h][m]);
        }
        os << "]" << (m + 1 < MONTHS_PER_YEAR ? "," : "") << l.newline;
    }
    os << l.indent << "}" << (last ? "" : ",") << l.newline;
}

} // anonymous namespace

void write_summary_json(std::ostream& os, const SimulationResult& result, int decimals,
                        bool pretty_print) {
    Layout l;
    l.indent = pretty_print ? "  " : "";
    l.newline = pretty_print ? "\n" : "";
    l.space = pretty_print ? " " : "";

    const YearSummary& summary = result.summary;

    os << "{" << l.newline;

    // Run metadata
    os << l.indent << "\"metadata\":" << l.space << "{" << l.newline;
    os << l.indent << l.indent << "\"trials\":" << l.space << result.trials << "," << l.newline;
    os << l.indent << l.indent << "\"percentile\":" << l.space << std::defaultfloat
       << summary.percentile_level << "," << l.newline;
    os << l.indent << l.indent << "\"seed\":" << l.space << result.seed << "," << l.newline;
    os << l.indent << l.indent << "\"device_count\":" << l.space << result.device_count << ","
       << l.newline;
    os << l.indent << l.indent << "\"execution_time_ms\":" << l.space << std::fixed
       << std::setprecision(2) << result.execution_time_ms << "," << l.newline;
    os << l.indent << l.indent << "\"unit\":" << l.space << "\"kW\"" << l.newline;
    os << l.indent << "}," << l.newline;

    os << l.indent << "\"undefined_cv_cells\":" << l.space << result.undefined_cv_cells << ","
       << l.newline;

    os << std::fixed << std::setprecision(decimals);
    auto write_number = [&os, decimals](double v) {
        os << round_to_decimals(v, decimals);
    };
    auto write_optional = [&os, decimals](const std::optional<double>& v) {
        if (v) {
            os << round_to_decimals(*v, decimals);
        } else {
            os << "null";
        }
    };

    write_table(os, l, "mean", summary.mean, write_number, false);
    write_table(os, l, "std_dev", summary.std_dev, write_number, false);
    write_table(os, l, "coefficient_of_variation", summary.coefficient_of_variation,
                write_optional, false);
    write_table(os, l, "percentile", summary.percentile, write_number, true);

    os << "}" << l.newline;
}

void write_summary_json(const std::string& filepath, const SimulationResult& result,
                        int decimals, bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_summary_json(file, result, decimals, pretty_print);
}

} // namespace io
} // namespace loadsim
