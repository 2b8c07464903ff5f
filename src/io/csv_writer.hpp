#ifndef LOADSIM_IO_CSV_WRITER_HPP
#define LOADSIM_IO_CSV_WRITER_HPP

#include "../detailed_output.hpp"
#include "../simulation.hpp"
#include "../statistics.hpp"
#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace loadsim {
namespace io {

// Cell text written for an undefined coefficient of variation
extern const char* const UNDEFINED_CELL;

// Round half away from zero to a fixed number of decimals
double round_to_decimals(double value, int decimals);

// Hour-by-month table: header "Hour,Jan,...,Dec", then one row per hour 0-23
void write_hour_month_table(std::ostream& os, const HourMonthTable& table, int decimals);
void write_hour_month_table(std::ostream& os, const OptionalHourMonthTable& table, int decimals);

// File names of the four summary tables
std::string mean_table_filename();
std::string std_dev_table_filename();
std::string variability_table_filename();
std::string percentile_table_filename(double percentile);

// Write the four summary tables into a directory (created if missing).
// Returns the paths written.
std::vector<std::string> write_summary_tables(const std::string& output_dir,
                                              const YearSummary& summary, int decimals);

// Detailed records: header "Trial,Device,Month,Hour,Load (kWh),Type".
// Streams the records as they are sampled; returns the number of rows.
size_t write_detailed_csv(std::ostream& os, const LoadModel& model, size_t trials,
                          uint64_t run_seed, int decimals);
size_t write_detailed_csv(const std::string& filepath, const LoadModel& model, size_t trials,
                          uint64_t run_seed, int decimals);
void write_detailed_csv(std::ostream& os, const std::vector<DetailedRecord>& records,
                        int decimals);

// Daily energy per trial: "Month,Trial,Daily sum (kWh)"
void write_daily_totals_csv(std::ostream& os, const SimulationResult& result, int decimals);

// Box-plot statistics per month: "Month,Min,Q1,Median,Q3,Max,Mean"
void write_daily_boxplot_csv(std::ostream& os, const SimulationResult& result, int decimals);

} // namespace io
} // namespace loadsim

#endif // LOADSIM_IO_CSV_WRITER_HPP
