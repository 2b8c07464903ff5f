#include "simulation_config.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace loadsim {

// ============================================================================
// SimulationConfig Implementation
// ============================================================================

SimulationConfig::SimulationConfig()
    : trials(100),
      percentile(90.0),
      seed(42),
      threads(0),
      round_decimals(3),
      detailed_output(false),
      daily_totals(false) {}

void SimulationConfig::validate() const {
    if (trials == 0) {
        throw ConfigurationError("trials must be greater than 0");
    }
    if (!std::isfinite(percentile) || percentile <= 0.0 || percentile >= 100.0) {
        throw ConfigurationError("percentile must be strictly between 0 and 100, got " +
                                 std::to_string(percentile));
    }
    if (threads < 0) {
        throw ConfigurationError("threads must be non-negative, got " + std::to_string(threads));
    }
    if (round_decimals < 0 || round_decimals > 12) {
        throw ConfigurationError("round_decimals must be between 0 and 12, got " +
                                 std::to_string(round_decimals));
    }
}

// ============================================================================
// RunConfig Implementation
// ============================================================================

RunConfig::RunConfig()
    : output_dir("Outputs"),
      detailed_format("csv"),
      log_level("INFO"),
      log_json(false) {}

void RunConfig::validate() const {
    simulation.validate();
    if (detailed_format != "csv" && detailed_format != "parquet") {
        throw ConfigurationError("detailed_format must be 'csv' or 'parquet', got '" +
                                 detailed_format + "'");
    }
    if (log_level != "DEBUG" && log_level != "INFO" &&
        log_level != "WARN" && log_level != "ERROR") {
        throw ConfigurationError("log level must be DEBUG, INFO, WARN or ERROR, got '" +
                                 log_level + "'");
    }
}

std::string resolve_relative_path(const std::string& path, const std::string& base_dir) {
    if (path.empty() || base_dir.empty()) {
        return path;
    }
    fs::path p(path);
    if (p.is_absolute()) {
        return path;
    }
    return (fs::path(base_dir) / p).string();
}

namespace {

// Integers arrive as signed JSON numbers; reject negatives before narrowing
size_t read_trials(const json& value) {
    if (!value.is_number_integer()) {
        throw ConfigurationError("simulation.trials must be an integer");
    }
    int64_t trials = value.get<int64_t>();
    if (trials <= 0) {
        throw ConfigurationError("trials must be greater than 0, got " + std::to_string(trials));
    }
    return static_cast<size_t>(trials);
}

uint64_t read_seed(const json& value) {
    if (!value.is_number_unsigned()) {
        throw ConfigurationError("simulation.seed must be a non-negative integer");
    }
    return value.get<uint64_t>();
}

int read_int(const json& value, const std::string& name) {
    if (!value.is_number_integer()) {
        throw ConfigurationError(name + " must be an integer");
    }
    if (value.is_number_unsigned()) {
        if (value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            throw ConfigurationError(name + " is out of range");
        }
    } else {
        int64_t v = value.get<int64_t>();
        if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
            throw ConfigurationError(name + " is out of range");
        }
    }
    return static_cast<int>(value.get<int64_t>());
}

// Returns nullptr when the block is absent; a present block must be an object
const json* section(const json& root, const char* name) {
    auto it = root.find(name);
    if (it == root.end()) {
        return nullptr;
    }
    if (!it->is_object()) {
        throw ConfigurationError(std::string("'") + name + "' must be a JSON object");
    }
    return &*it;
}

} // anonymous namespace

RunConfig parse_run_config_from_string(const std::string& json_string,
                                       const std::string& base_dir) {
    RunConfig config;

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw ConfigurationError("Configuration must be a JSON object");
        }

        if (j.contains("devices")) {
            config.devices_path = resolve_relative_path(j["devices"].get<std::string>(), base_dir);
        }
        if (j.contains("profiles_dir")) {
            config.profiles_dir = resolve_relative_path(j["profiles_dir"].get<std::string>(), base_dir);
        }
        if (j.contains("output_dir")) {
            config.output_dir = resolve_relative_path(j["output_dir"].get<std::string>(), base_dir);
        }

        if (const json* block = section(j, "simulation")) {
            const auto& sim = *block;
            if (sim.contains("trials")) config.simulation.trials = read_trials(sim["trials"]);
            if (sim.contains("percentile")) config.simulation.percentile = sim["percentile"].get<double>();
            if (sim.contains("seed")) config.simulation.seed = read_seed(sim["seed"]);
            if (sim.contains("threads")) {
                config.simulation.threads = read_int(sim["threads"], "simulation.threads");
            }
        }

        if (const json* block = section(j, "outputs")) {
            const auto& out = *block;
            if (out.contains("detailed")) config.simulation.detailed_output = out["detailed"].get<bool>();
            if (out.contains("detailed_format")) config.detailed_format = out["detailed_format"].get<std::string>();
            if (out.contains("daily_totals")) config.simulation.daily_totals = out["daily_totals"].get<bool>();
            if (out.contains("round_decimals")) {
                config.simulation.round_decimals = read_int(out["round_decimals"], "outputs.round_decimals");
            }
            if (out.contains("summary_json")) {
                config.summary_json_path =
                    resolve_relative_path(out["summary_json"].get<std::string>(), base_dir);
            }
        }

        if (const json* block = section(j, "logging")) {
            const auto& log = *block;
            if (log.contains("level")) config.log_level = log["level"].get<std::string>();
            if (log.contains("json")) config.log_json = log["json"].get<bool>();
            if (log.contains("file")) {
                config.log_file = resolve_relative_path(log["file"].get<std::string>(), base_dir);
            }
        }
    } catch (const json::exception& e) {
        throw ConfigurationError("Invalid configuration: " + std::string(e.what()));
    }

    return config;
}

RunConfig parse_run_config_from_file(const std::string& file_path) {
    std::ifstream f(file_path);
    if (!f.is_open()) {
        throw ConfigurationError("Failed to open configuration file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << f.rdbuf();

    std::string base_dir = fs::path(file_path).parent_path().string();
    return parse_run_config_from_string(buffer.str(), base_dir);
}

} // namespace loadsim
