#include "csv_writer.hpp"
#include "../errors.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace loadsim {
namespace io {

const char* const UNDEFINED_CELL = "undefined";

namespace {

const char* const SUMMARY_SUFFIX = "_system_load_values.csv";

std::ofstream open_output(const std::string& filepath) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    return file;
}

void write_value(std::ostream& os, double value, int decimals) {
    os << std::fixed << std::setprecision(decimals) << round_to_decimals(value, decimals);
}

// CSV cells containing the delimiter or quotes are quoted
std::string escape_cell(const std::string& cell) {
    if (cell.find_first_of(",\"\n") == std::string::npos) {
        return cell;
    }
    std::string escaped = "\"";
    for (char c : cell) {
        if (c == '"') escaped += '"';
        escaped += c;
    }
    escaped += '"';
    return escaped;
}

void write_month_header(std::ostream& os) {
    os << "Hour";
    for (size_t m = 0; m < MONTHS_PER_YEAR; ++m) {
        os << "," << month_name(m);
    }
    os << "\n";
}

void write_detailed_header(std::ostream& os) {
    os << "Trial,Device,Month,Hour,Load (kWh),Type\n";
}

void write_detailed_row(std::ostream& os, const DetailedRecord& r, int decimals) {
    os << r.trial << ',' << escape_cell(r.device) << ',' << month_name(r.month) << ','
       << static_cast<int>(r.hour) << ',';
    write_value(os, r.load_kwh, decimals);
    os << ',' << escape_cell(r.type) << '\n';
}

} // anonymous namespace

double round_to_decimals(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

void write_hour_month_table(std::ostream& os, const HourMonthTable& table, int decimals) {
    write_month_header(os);
    for (size_t h = 0; h < HOURS_PER_DAY; ++h) {
        os << h;
        for (size_t m = 0; m < MONTHS_PER_YEAR; ++m) {
            os << ",";
            write_value(os, table[h][m], decimals);
        }
        os << "\n";
    }
}

void write_hour_month_table(std::ostream& os, const OptionalHourMonthTable& table, int decimals) {
    write_month_header(os);
    for (size_t h = 0; h < HOURS_PER_DAY; ++h) {
        os << h;
        for (size_t m = 0; m < MONTHS_PER_YEAR; ++m) {
            os << ",";
            if (table[h][m]) {
                write_value(os, *table[h][m], decimals);
            } else {
                os << UNDEFINED_CELL;
            }
        }
        os << "\n";
    }
}

std::string mean_table_filename() {
    return std::string("mean") + SUMMARY_SUFFIX;
}

std::string std_dev_table_filename() {
    return std::string("standard_deviation") + SUMMARY_SUFFIX;
}

std::string variability_table_filename() {
    return std::string("percentage_variability") + SUMMARY_SUFFIX;
}

std::string percentile_table_filename(double percentile) {
    std::ostringstream oss;
    if (std::floor(percentile) == percentile) {
        oss << static_cast<long long>(percentile);
    } else {
        oss << percentile;
    }
    oss << "_percentile" << SUMMARY_SUFFIX;
    return oss.str();
}

std::vector<std::string> write_summary_tables(const std::string& output_dir,
                                              const YearSummary& summary, int decimals) {
    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec) {
        throw std::runtime_error("Failed to create output directory " + output_dir +
                                 ": " + ec.message());
    }

    std::vector<std::string> written;

    auto path_of = [&output_dir](const std::string& name) {
        return (fs::path(output_dir) / name).string();
    };

    std::string mean_path = path_of(mean_table_filename());
    {
        std::ofstream file = open_output(mean_path);
        write_hour_month_table(file, summary.mean, decimals);
    }
    written.push_back(mean_path);

    std::string std_path = path_of(std_dev_table_filename());
    {
        std::ofstream file = open_output(std_path);
        write_hour_month_table(file, summary.std_dev, decimals);
    }
    written.push_back(std_path);

    std::string cv_path = path_of(variability_table_filename());
    {
        std::ofstream file = open_output(cv_path);
        write_hour_month_table(file, summary.coefficient_of_variation, decimals);
    }
    written.push_back(cv_path);

    std::string pct_path = path_of(percentile_table_filename(summary.percentile_level));
    {
        std::ofstream file = open_output(pct_path);
        write_hour_month_table(file, summary.percentile, decimals);
    }
    written.push_back(pct_path);

    return written;
}

size_t write_detailed_csv(std::ostream& os, const LoadModel& model, size_t trials,
                          uint64_t run_seed, int decimals) {
    write_detailed_header(os);
    size_t rows = 0;
    for_each_detailed_record(model, trials, run_seed, [&](const DetailedRecord& r) {
        write_detailed_row(os, r, decimals);
        ++rows;
    });
    return rows;
}

size_t write_detailed_csv(const std::string& filepath, const LoadModel& model, size_t trials,
                          uint64_t run_seed, int decimals) {
    std::ofstream file = open_output(filepath);
    return write_detailed_csv(file, model, trials, run_seed, decimals);
}

void write_detailed_csv(std::ostream& os, const std::vector<DetailedRecord>& records,
                        int decimals) {
    write_detailed_header(os);
    for (const auto& r : records) {
        write_detailed_row(os, r, decimals);
    }
}

void write_daily_totals_csv(std::ostream& os, const SimulationResult& result, int decimals) {
    os << "Month,Trial,Daily sum (kWh)\n";
    for (size_t m = 0; m < MONTHS_PER_YEAR; ++m) {
        const auto& totals = result.daily_totals_kwh[m];
        for (size_t t = 0; t < totals.size(); ++t) {
            os << month_name(m) << ',' << t << ',';
            write_value(os, totals[t], decimals);
            os << '\n';
        }
    }
}

void write_daily_boxplot_csv(std::ostream& os, const SimulationResult& result, int decimals) {
    os << "Month,Min,Q1,Median,Q3,Max,Mean\n";
    for (size_t m = 0; m < MONTHS_PER_YEAR; ++m) {
        BoxplotStats stats = calculate_boxplot(result.daily_totals_kwh[m]);
        os << month_name(m);
        for (double v : {stats.min, stats.q1, stats.median, stats.q3, stats.max, stats.mean}) {
            os << ',';
            write_value(os, v, decimals);
        }
        os << '\n';
    }
}

} // namespace io
} // namespace loadsim
