#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include "errors.hpp"
#include "device.hpp"
#include "utilization.hpp"
#include "load_model.hpp"
#include "logger.hpp"
#include "simulation.hpp"
#include "simulation_config.hpp"
#include "io/csv_writer.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_writer.hpp"

namespace fs = std::filesystem;
using namespace loadsim;

namespace {

// Command-line values; unset options keep the config file's (or default) value
struct CLIArgs {
    std::string config_path;
    std::optional<std::string> devices_path;
    std::optional<std::string> profiles_dir;
    std::optional<std::string> output_dir;
    std::optional<size_t> trials;
    std::optional<double> percentile;
    std::optional<uint64_t> seed;
    std::optional<int> threads;
    bool detailed = false;
    std::optional<std::string> detailed_format;
    bool daily_totals = false;
    std::optional<std::string> summary_json_path;
    std::optional<std::string> log_level;
    bool log_json = false;
    std::optional<std::string> log_file;
    bool help = false;
};

const char* const DETAILED_BASENAME = "detailed_system_load_values";
const char* const DAILY_TOTALS_FILENAME = "daily_system_energy.csv";
const char* const DAILY_BOXPLOT_FILENAME = "daily_system_energy_boxplot.csv";

void print_usage(const char* program_name) {
    std::cerr << "LoadSim v1.0.0 - Monte Carlo community load simulator\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Input options:\n";
    std::cerr << "  --config <path>          JSON config file\n";
    std::cerr << "  --devices <path>         Device list CSV\n";
    std::cerr << "  --profiles <dir>         Utilisation profile directory (<device>_times.csv)\n\n";
    std::cerr << "Simulation options:\n";
    std::cerr << "  --trials <n>             Trials per month (default: 100)\n";
    std::cerr << "  --percentile <p>         Percentile in (0,100) (default: 90)\n";
    std::cerr << "  --seed <value>           Random seed (default: 42)\n";
    std::cerr << "  --threads <n>            Worker threads, 0 = all (default: 0)\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output-dir <dir>       Output directory (default: Outputs)\n";
    std::cerr << "  --detailed               Also write the detailed record table\n";
    std::cerr << "  --detailed-format <fmt>  csv or parquet (default: csv)\n";
    std::cerr << "  --daily-totals           Also write daily totals and box-plot statistics\n";
    std::cerr << "  --summary-json <path>    Also write a JSON summary\n\n";
    std::cerr << "Logging options:\n";
    std::cerr << "  --log-level <level>      DEBUG, INFO, WARN, ERROR (default: INFO)\n";
    std::cerr << "  --log-json               Emit JSON log lines\n";
    std::cerr << "  --log-file <path>        Also append logs to a file\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                   Show this help message\n\n";
    std::cerr << "Example:\n";
    std::cerr << "  " << program_name << " --devices data/device_list.csv \\\n";
    std::cerr << "      --profiles data/profiles --trials 500 --percentile 95 \\\n";
    std::cerr << "      --daily-totals --output-dir Outputs\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

// Whole-string numeric conversion; trailing characters are an error
template <typename T, typename Convert>
bool convert_value(const std::string& option, const std::string& text, Convert convert, T& out) {
    try {
        size_t pos = 0;
        out = convert(text, &pos);
        if (pos != text.size()) {
            throw std::invalid_argument(text);
        }
        return true;
    } catch (const std::exception&) {
        std::cerr << "Error: Invalid value for " << option << ": " << text << "\n";
        return false;
    }
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    auto to_long_long = [](const std::string& s, size_t* pos) { return std::stoll(s, pos); };
    auto to_ull = [](const std::string& s, size_t* pos) { return std::stoull(s, pos); };
    auto to_double = [](const std::string& s, size_t* pos) { return std::stod(s, pos); };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--devices" && i + 1 < argc) {
            args.devices_path = argv[++i];
        } else if (arg == "--profiles" && i + 1 < argc) {
            args.profiles_dir = argv[++i];
        } else if (arg == "--output-dir" && i + 1 < argc) {
            args.output_dir = argv[++i];
        } else if (arg == "--trials" && i + 1 < argc) {
            long long value = 0;
            if (!convert_value(arg, argv[++i], to_long_long, value)) return false;
            if (value <= 0) {
                std::cerr << "Error: --trials must be greater than 0\n";
                return false;
            }
            args.trials = static_cast<size_t>(value);
        } else if (arg == "--percentile" && i + 1 < argc) {
            double value = 0.0;
            if (!convert_value(arg, argv[++i], to_double, value)) return false;
            args.percentile = value;
        } else if (arg == "--seed" && i + 1 < argc) {
            unsigned long long value = 0;
            std::string text = argv[++i];
            if (!text.empty() && text[0] == '-') {
                std::cerr << "Error: --seed must be non-negative\n";
                return false;
            }
            if (!convert_value(arg, text, to_ull, value)) return false;
            args.seed = static_cast<uint64_t>(value);
        } else if (arg == "--threads" && i + 1 < argc) {
            long long value = 0;
            if (!convert_value(arg, argv[++i], to_long_long, value)) return false;
            if (value < 0 || value > std::numeric_limits<int>::max()) {
                std::cerr << "Error: --threads must be between 0 and "
                          << std::numeric_limits<int>::max() << "\n";
                return false;
            }
            args.threads = static_cast<int>(value);
        } else if (arg == "--detailed") {
            args.detailed = true;
        } else if (arg == "--detailed-format" && i + 1 < argc) {
            args.detailed_format = argv[++i];
        } else if (arg == "--daily-totals") {
            args.daily_totals = true;
        } else if (arg == "--summary-json" && i + 1 < argc) {
            args.summary_json_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--log-json") {
            args.log_json = true;
        } else if (arg == "--log-file" && i + 1 < argc) {
            args.log_file = argv[++i];
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

// Defaults, then the config file, then command-line options
RunConfig build_run_config(const CLIArgs& args) {
    RunConfig config = args.config_path.empty() ? RunConfig()
                                                : parse_run_config_from_file(args.config_path);

    if (args.devices_path) config.devices_path = *args.devices_path;
    if (args.profiles_dir) config.profiles_dir = *args.profiles_dir;
    if (args.output_dir) config.output_dir = *args.output_dir;
    if (args.trials) config.simulation.trials = *args.trials;
    if (args.percentile) config.simulation.percentile = *args.percentile;
    if (args.seed) config.simulation.seed = *args.seed;
    if (args.threads) config.simulation.threads = *args.threads;
    if (args.detailed) config.simulation.detailed_output = true;
    if (args.detailed_format) config.detailed_format = *args.detailed_format;
    if (args.daily_totals) config.simulation.daily_totals = true;
    if (args.summary_json_path) config.summary_json_path = *args.summary_json_path;
    if (args.log_level) config.log_level = *args.log_level;
    if (args.log_json) config.log_json = true;
    if (args.log_file) config.log_file = *args.log_file;

    // Accept any case and WARNING on input; store the canonical name
    config.log_level = level_to_string(string_to_level(config.log_level));
    std::transform(config.detailed_format.begin(), config.detailed_format.end(),
                   config.detailed_format.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    config.validate();

    if (config.devices_path.empty()) {
        throw ConfigurationError("A device list is required (--devices or \"devices\" in --config)");
    }
    if (config.profiles_dir.empty()) {
        throw ConfigurationError(
            "A utilisation profile directory is required (--profiles or \"profiles_dir\" in --config)");
    }
    if (!file_exists(config.devices_path)) {
        throw DataError("Device list not found: " + config.devices_path);
    }
    if (config.simulation.detailed_output && config.detailed_format == "parquet" &&
        !ParquetWriter::available()) {
        throw ConfigurationError(
            "Parquet output requested but Apache Arrow is not available. Rebuild with -DHAVE_ARROW.");
    }
    return config;
}

void configure_logger(const RunConfig& config) {
    LoggerConfig logger_config;
    logger_config.min_level = string_to_level(config.log_level);
    logger_config.enable_json = config.log_json;
    if (!config.log_file.empty()) {
        logger_config.enable_file = true;
        logger_config.log_file_path = config.log_file;
    }
    Logger::get_instance().configure(logger_config);
}

LoadModel load_model(const RunConfig& config) {
    Logger& logger = Logger::get_instance();

    DeviceCatalog catalog = DeviceCatalog::load_from_csv(config.devices_path);
    logger.log_data_loaded("devices", config.devices_path, catalog.size());

    std::vector<std::string> ids = catalog.device_ids();
    ProfileSet profiles = ProfileSet::load_from_directory(config.profiles_dir, ids);
    logger.log_data_loaded("profiles", config.profiles_dir, profiles.size());

    for (const auto& id : ProfileSet::list_directory(config.profiles_dir)) {
        if (!catalog.contains(id)) {
            logger.log_warning("Ignoring utilisation profile for unknown device '" + id + "'");
        }
    }

    return LoadModel(std::move(catalog), profiles);
}

void write_outputs(const RunConfig& config, const LoadModel& model,
                   const SimulationResult& result) {
    Logger& logger = Logger::get_instance();
    const int decimals = config.simulation.round_decimals;

    for (const auto& path : io::write_summary_tables(config.output_dir, result.summary, decimals)) {
        logger.log_output_written(path, HOURS_PER_DAY);
    }

    if (!config.summary_json_path.empty()) {
        fs::path json_path(config.summary_json_path);
        if (json_path.has_parent_path()) {
            fs::create_directories(json_path.parent_path());
        }
        io::write_summary_json(config.summary_json_path, result, decimals);
        logger.log_output_written(config.summary_json_path, 1);
    }

    if (config.simulation.daily_totals) {
        std::string totals_path = (fs::path(config.output_dir) / DAILY_TOTALS_FILENAME).string();
        std::ofstream totals_file(totals_path);
        if (!totals_file) {
            throw std::runtime_error("Failed to open output file: " + totals_path);
        }
        io::write_daily_totals_csv(totals_file, result, decimals);
        logger.log_output_written(totals_path, MONTHS_PER_YEAR * result.trials);

        std::string boxplot_path = (fs::path(config.output_dir) / DAILY_BOXPLOT_FILENAME).string();
        std::ofstream boxplot_file(boxplot_path);
        if (!boxplot_file) {
            throw std::runtime_error("Failed to open output file: " + boxplot_path);
        }
        io::write_daily_boxplot_csv(boxplot_file, result, decimals);
        logger.log_output_written(boxplot_path, MONTHS_PER_YEAR);
    }

    if (config.simulation.detailed_output) {
        const auto& sim = config.simulation;
        if (config.detailed_format == "parquet") {
            std::string path =
                (fs::path(config.output_dir) / (std::string(DETAILED_BASENAME) + ".parquet")).string();
            size_t rows = ParquetWriter::write_detailed_records(model, sim.trials, sim.seed, path);
            logger.log_output_written(path, rows);
        } else {
            std::string path =
                (fs::path(config.output_dir) / (std::string(DETAILED_BASENAME) + ".csv")).string();
            size_t rows = io::write_detailed_csv(path, model, sim.trials, sim.seed, decimals);
            logger.log_output_written(path, rows);
        }
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    if (!args.config_path.empty() && !file_exists(args.config_path)) {
        std::cerr << "Error: Config file not found: " << args.config_path << "\n";
        return 1;
    }

    Logger& logger = Logger::get_instance();

    try {
        RunConfig config = build_run_config(args);
        configure_logger(config);

        // All inputs are validated here, before any output file exists
        LoadModel model = load_model(config);

        logger.log_run_start(config.simulation, model.device_count());
        SimulationResult result = run_simulation(model, config.simulation);

        write_outputs(config, model, result);
        logger.log_run_complete(result.execution_time_ms, result.undefined_cv_cells);

    } catch (const ConfigurationError& e) {
        logger.log_error(std::string("Configuration error: ") + e.what());
        return 1;
    } catch (const DataError& e) {
        logger.log_error(std::string("Data error: ") + e.what());
        return 1;
    } catch (const std::exception& e) {
        logger.log_error(e.what());
        return 1;
    }

    logger.flush();
    return 0;
}
