/**
 * @file logger.hpp
 * @brief Structured logging for the load simulator
 *
 * The Logger provides structured logging with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - Plain text or JSON-formatted output (one object per line)
 * - Console (stderr) and optional append-mode file output
 * - Run events: configuration, data loading, per-month progress, outputs
 *
 * The logger only holds output settings. Simulation inputs and random state
 * are never stored here. Events are emitted from the driving thread, outside
 * the parallel sampling loops.
 */

#ifndef LOADSIM_LOGGER_HPP
#define LOADSIM_LOGGER_HPP

#include "simulation_config.hpp"
#include <cstddef>
#include <fstream>
#include <map>
#include <memory>
#include <string>

namespace loadsim {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Per-cell detail (degenerate statistics, stream seeds)
    INFO,    ///< Run progress (configuration, months, outputs)
    WARN,    ///< Non-fatal issues (unused profiles)
    ERROR    ///< Failures reported before exit
};

/**
 * @brief Convert log level to string
 */
std::string level_to_string(LogLevel level);

/**
 * @brief Parse log level from string (case-insensitive)
 *
 * @throws ConfigurationError for an unknown level name
 */
LogLevel string_to_level(const std::string& level_str);

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("loadsim.log"),
          enable_json(false) {}
};

/**
 * @brief Structured logger
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_json = true;
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *   logger.log_run_start(sim_config, catalog.size());
 *   logger.log_month_complete(0, sim_config.trials, 12.5, 0);
 *   @endcode
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     *
     * Reopens the log file when file output is enabled.
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log the configuration a run starts with
     */
    void log_run_start(const SimulationConfig& config, size_t device_count);

    /**
     * @brief Log an input table that was loaded
     *
     * @param what Table kind ("devices", "profiles")
     * @param source File or directory it came from
     * @param rows Number of entries loaded
     */
    void log_data_loaded(const std::string& what, const std::string& source, size_t rows);

    /**
     * @brief Log completion of one month's ensemble and summary
     */
    void log_month_complete(size_t month, size_t trials, double elapsed_ms,
                            size_t undefined_cv_cells);

    /**
     * @brief Log an hour whose coefficient of variation is undefined (mean load 0)
     */
    void log_degenerate_statistic(size_t month, size_t hour);

    /**
     * @brief Log a file written by an output adapter
     */
    void log_output_written(const std::string& path, size_t rows);

    /**
     * @brief Log the end of a run
     */
    void log_run_complete(double execution_time_ms, size_t undefined_cv_cells);

    void log_warning(const std::string& warning_message);
    void log_error(const std::string& error_message);

    /**
     * @brief Free-form message with extra fields
     */
    void log(LogLevel level, const std::string& message,
             const std::map<std::string, std::string>& fields = {});

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level) { config_.min_level = level; }
    LogLevel get_min_level() const { return config_.min_level; }

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;

    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace loadsim

#endif // LOADSIM_LOGGER_HPP
