/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include "errors.hpp"
#include "sampler.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace loadsim {

namespace {

std::string month_label(size_t month) {
    return month < MONTHS_PER_YEAR ? month_name(month) : std::to_string(month);
}

std::string format_double(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

} // anonymous namespace

std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

LogLevel string_to_level(const std::string& level_str) {
    std::string upper = level_str;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    throw ConfigurationError("Unknown log level: " + level_str);
}

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    config_ = config;

    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_run_start(const SimulationConfig& config, size_t device_count) {
    std::map<std::string, std::string> fields;
    fields["event"] = "run_start";
    fields["trials"] = std::to_string(config.trials);
    fields["percentile"] = format_double(config.percentile);
    fields["seed"] = std::to_string(config.seed);
    fields["threads"] = std::to_string(config.threads);
    fields["devices"] = std::to_string(device_count);
    fields["detailed_output"] = config.detailed_output ? "true" : "false";
    fields["daily_totals"] = config.daily_totals ? "true" : "false";

    log(LogLevel::INFO, "Starting Monte Carlo load simulation", fields);
}

void Logger::log_data_loaded(const std::string& what, const std::string& source, size_t rows) {
    std::map<std::string, std::string> fields;
    fields["event"] = "data_loaded";
    fields["table"] = what;
    fields["source"] = source;
    fields["rows"] = std::to_string(rows);

    log(LogLevel::INFO, "Loaded " + what, fields);
}

void Logger::log_month_complete(size_t month, size_t trials, double elapsed_ms,
                                size_t undefined_cv_cells) {
    std::map<std::string, std::string> fields;
    fields["event"] = "month_complete";
    fields["month"] = month_label(month);
    fields["trials"] = std::to_string(trials);
    fields["elapsed_ms"] = format_double(elapsed_ms);
    fields["undefined_cv_cells"] = std::to_string(undefined_cv_cells);

    log(LogLevel::INFO, "Month " + month_label(month) + " complete", fields);
}

void Logger::log_degenerate_statistic(size_t month, size_t hour) {
    std::map<std::string, std::string> fields;
    fields["event"] = "degenerate_statistic";
    fields["statistic"] = "coefficient_of_variation";
    fields["month"] = month_label(month);
    fields["hour"] = std::to_string(hour);

    log(LogLevel::DEBUG, "Coefficient of variation undefined (mean load is zero)", fields);
}

void Logger::log_output_written(const std::string& path, size_t rows) {
    std::map<std::string, std::string> fields;
    fields["event"] = "output_written";
    fields["path"] = path;
    fields["rows"] = std::to_string(rows);

    log(LogLevel::INFO, "Wrote " + path, fields);
}

void Logger::log_run_complete(double execution_time_ms, size_t undefined_cv_cells) {
    std::map<std::string, std::string> fields;
    fields["event"] = "run_complete";
    fields["execution_time_ms"] = format_double(execution_time_ms);
    fields["undefined_cv_cells"] = std::to_string(undefined_cv_cells);

    log(LogLevel::INFO, "Simulation complete", fields);
}

void Logger::log_warning(const std::string& warning_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    log(LogLevel::WARN, warning_message, fields);
}

void Logger::log_error(const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    log(LogLevel::ERROR, error_message, fields);
}

void Logger::flush() {
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::log(LogLevel level, const std::string& message,
                 const std::map<std::string, std::string>& fields) {
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace loadsim
