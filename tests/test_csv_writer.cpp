#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "io/csv_writer.hpp"
#include "io/csv_reader.hpp"
#include "logger.hpp"

using namespace loadsim;
using Catch::Matchers::WithinRel;
using Catch::Matchers::StartsWith;

namespace fs = std::filesystem;

namespace {

std::vector<std::string> read_lines(std::istream& is) {
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(is, line)) {
        lines.push_back(line);
    }
    return lines;
}

std::vector<std::string> read_file_lines(const fs::path& path) {
    std::ifstream file(path);
    return read_lines(file);
}

LoadModel make_model() {
    DeviceCatalog catalog;
    catalog.add(Device("Light", 10.0, 40, true, "Domestic"));
    catalog.add(Device("Fridge", 150.0, 2, true, "Commercial"));

    ProfileSet profiles;
    profiles.add("Light", UtilizationProfile::constant(0.3));
    profiles.add("Fridge", UtilizationProfile::constant(1.0));
    return LoadModel(std::move(catalog), profiles);
}

} // anonymous namespace

TEST_CASE("Rounding to fixed decimals", "[csv_writer]") {
    REQUIRE(io::round_to_decimals(1.23456, 3) == 1.235);
    REQUIRE(io::round_to_decimals(1.2344, 3) == 1.234);
    REQUIRE(io::round_to_decimals(2.5, 0) == 3.0);
    REQUIRE(io::round_to_decimals(0.0, 3) == 0.0);
}

TEST_CASE("Summary file names", "[csv_writer]") {
    REQUIRE(io::mean_table_filename() == "mean_system_load_values.csv");
    REQUIRE(io::std_dev_table_filename() == "standard_deviation_system_load_values.csv");
    REQUIRE(io::variability_table_filename() == "percentage_variability_system_load_values.csv");
    REQUIRE(io::percentile_table_filename(90.0) == "90_percentile_system_load_values.csv");
    REQUIRE(io::percentile_table_filename(97.5) == "97.5_percentile_system_load_values.csv");
}

TEST_CASE("Hour-by-month table layout", "[csv_writer]") {
    HourMonthTable table{};
    for (size_t h = 0; h < 24; ++h) {
        for (size_t m = 0; m < 12; ++m) {
            table[h][m] = static_cast<double>(h) + static_cast<double>(m) / 100.0 + 0.00049;
        }
    }

    std::ostringstream os;
    io::write_hour_month_table(os, table, 3);

    std::istringstream is(os.str());
    auto lines = read_lines(is);
    REQUIRE(lines.size() == 25);
    REQUIRE(lines[0] == "Hour,Jan,Feb,Mar,Apr,May,Jun,Jul,Aug,Sep,Oct,Nov,Dec");
    REQUIRE(lines[1] == "0,0.000,0.010,0.020,0.030,0.040,0.050,0.060,0.070,0.080,0.090,0.100,0.110");
    REQUIRE_THAT(lines[24], StartsWith("23,23.000,23.010"));
}

TEST_CASE("Undefined CV cells are marked", "[csv_writer]") {
    OptionalHourMonthTable table;
    for (auto& row : table) {
        row.fill(std::nullopt);
    }
    table[0][0] = 0.25;

    std::ostringstream os;
    io::write_hour_month_table(os, table, 3);

    std::istringstream is(os.str());
    auto lines = read_lines(is);
    REQUIRE_THAT(lines[1], StartsWith("0,0.250,undefined,undefined"));
    REQUIRE(lines[2].find("0.") == std::string::npos);
}

TEST_CASE("Summary tables are written to the output directory", "[csv_writer]") {
    fs::path dir = fs::temp_directory_path() / "loadsim_test_summary" / "nested";
    fs::remove_all(dir.parent_path());

    YearSummary summary;
    summary.percentile_level = 90.0;
    summary.mean[12][6] = 1.5;
    summary.coefficient_of_variation[12][6] = 0.2;

    auto written = io::write_summary_tables(dir.string(), summary, 3);

    REQUIRE(written.size() == 4);
    REQUIRE(fs::exists(dir / "mean_system_load_values.csv"));
    REQUIRE(fs::exists(dir / "standard_deviation_system_load_values.csv"));
    REQUIRE(fs::exists(dir / "percentage_variability_system_load_values.csv"));
    REQUIRE(fs::exists(dir / "90_percentile_system_load_values.csv"));

    auto mean_lines = read_file_lines(dir / "mean_system_load_values.csv");
    REQUIRE(mean_lines.size() == 25);
    REQUIRE_THAT(mean_lines[13], StartsWith("12,0.000,0.000,0.000,0.000,0.000,0.000,1.500"));

    auto cv_lines = read_file_lines(dir / "percentage_variability_system_load_values.csv");
    REQUIRE_THAT(cv_lines[13], StartsWith("12,undefined,undefined,undefined,undefined,undefined,undefined,0.200"));

    fs::remove_all(dir.parent_path());
}

TEST_CASE("Detailed CSV rows", "[csv_writer][detailed]") {
    LoadModel model = make_model();

    std::ostringstream os;
    size_t rows = io::write_detailed_csv(os, model, 2, 42, 3);
    REQUIRE(rows == 2 * 2 * 12 * 24);

    std::istringstream is(os.str());
    CsvReader reader(is);
    auto header = reader.read_row();
    REQUIRE(header == std::vector<std::string>{"Trial", "Device", "Month", "Hour", "Load (kWh)", "Type"});

    auto first = reader.read_row();
    REQUIRE(first[0] == "0");
    REQUIRE(first[1] == "Light");
    REQUIRE(first[2] == "Jan");
    REQUIRE(first[3] == "0");
    REQUIRE(first[5] == "Domestic");

    size_t count = 1;
    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty()) continue;
        REQUIRE(row.size() == 6);
        if (row[1] == "Fridge") {
            REQUIRE(row[4] == "0.300");
        }
        ++count;
    }
    REQUIRE(count == rows);
}

TEST_CASE("Detailed CSV quotes awkward names", "[csv_writer][detailed]") {
    std::vector<DetailedRecord> records(1);
    records[0].trial = 3;
    records[0].device = "Fridge, large";
    records[0].month = 11;
    records[0].hour = 23;
    records[0].load_kwh = 0.15;
    records[0].type = "Commercial";

    std::ostringstream os;
    io::write_detailed_csv(os, records, 2);

    std::istringstream is(os.str());
    auto lines = read_lines(is);
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[1] == "3,\"Fridge, large\",Dec,23,0.15,Commercial");
}

TEST_CASE("Daily totals and box-plot CSV", "[csv_writer][daily_totals]") {
    SimulationResult result;
    result.trials = 3;
    for (size_t m = 0; m < 12; ++m) {
        result.daily_totals_kwh[m] = {1.0, 2.0, 3.0};
    }
    result.daily_totals_kwh[1] = {10.0, 30.0, 20.0};

    std::ostringstream totals;
    io::write_daily_totals_csv(totals, result, 3);
    std::istringstream totals_in(totals.str());
    auto total_lines = read_lines(totals_in);
    REQUIRE(total_lines.size() == 1 + 12 * 3);
    REQUIRE(total_lines[0] == "Month,Trial,Daily sum (kWh)");
    REQUIRE(total_lines[1] == "Jan,0,1.000");
    REQUIRE(total_lines[5] == "Feb,1,30.000");

    std::ostringstream boxplot;
    io::write_daily_boxplot_csv(boxplot, result, 3);
    std::istringstream boxplot_in(boxplot.str());
    auto box_lines = read_lines(boxplot_in);
    REQUIRE(box_lines.size() == 13);
    REQUIRE(box_lines[0] == "Month,Min,Q1,Median,Q3,Max,Mean");
    REQUIRE(box_lines[1] == "Jan,1.000,1.500,2.000,2.500,3.000,2.000");
    REQUIRE(box_lines[2] == "Feb,10.000,15.000,20.000,25.000,30.000,20.000");
}
