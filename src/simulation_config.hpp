#ifndef LOADSIM_SIMULATION_CONFIG_HPP
#define LOADSIM_SIMULATION_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace loadsim {

// Configuration of one simulation run, constant for its whole duration
struct SimulationConfig {
    size_t trials;              // Monte Carlo trials per month (> 0)
    double percentile;          // e.g. 90 means 90% of trial loads fall below the value
    uint64_t seed;              // Run seed; every random stream derives from it
    int threads;                // Worker threads, 0 = OpenMP runtime default
    int round_decimals;         // Precision of persisted tables
    bool detailed_output;       // Also produce the per-device record table
    bool daily_totals;          // Keep each trial's daily energy for box-plot data

    SimulationConfig();

    // Throws ConfigurationError describing the first invalid field
    void validate() const;
};

// Where the inputs come from and where results go
struct RunConfig {
    std::string devices_path;
    std::string profiles_dir;
    std::string output_dir;
    std::string detailed_format;   // "csv" or "parquet"
    std::string summary_json_path; // empty = no JSON summary

    std::string log_level;         // DEBUG, INFO, WARN, ERROR
    bool log_json;
    std::string log_file;          // empty = console only

    SimulationConfig simulation;

    RunConfig();

    // Validates the simulation block and the output options
    void validate() const;
};

/**
 * @brief Parse a run configuration from a JSON file
 *
 * Relative paths in the file resolve against the file's directory.
 * Fields absent from the file keep their defaults.
 *
 * @throws ConfigurationError if the file cannot be read, the JSON is invalid,
 *         or a value has the wrong type
 */
RunConfig parse_run_config_from_file(const std::string& file_path);

/**
 * @brief Parse a run configuration from a JSON string
 *
 * @param json_string JSON document
 * @param base_dir Directory that relative paths resolve against ("" = unchanged)
 * @throws ConfigurationError on invalid JSON or wrong value types
 */
RunConfig parse_run_config_from_string(const std::string& json_string,
                                       const std::string& base_dir = "");

// Resolve a path against a base directory; absolute paths are returned unchanged
std::string resolve_relative_path(const std::string& path, const std::string& base_dir);

} // namespace loadsim

#endif // LOADSIM_SIMULATION_CONFIG_HPP
