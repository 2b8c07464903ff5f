#include "utilization.hpp"
#include "errors.hpp"
#include "io/csv_reader.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace loadsim {

// ============================================================================
// UtilizationProfile Implementation
// ============================================================================

UtilizationProfile::UtilizationProfile() {
    for (auto& hour_row : probabilities_) {
        hour_row.fill(0.0);
    }
}

void UtilizationProfile::set_probability(size_t hour, size_t month, double probability) {
    if (hour >= NUM_HOURS) {
        throw std::out_of_range("Hour " + std::to_string(hour) + " must be between 0 and 23");
    }
    if (month >= NUM_MONTHS) {
        throw std::out_of_range("Month " + std::to_string(month) + " must be between 0 and 11");
    }
    if (!(probability >= 0.0 && probability <= 1.0)) {
        throw DataError("Utilisation probability must be between 0.0 and 1.0, got " +
                        std::to_string(probability));
    }
    probabilities_[hour][month] = probability;
}

double UtilizationProfile::get_probability(size_t hour, size_t month) const {
    if (hour >= NUM_HOURS) {
        throw std::out_of_range("Hour " + std::to_string(hour) + " must be between 0 and 23");
    }
    if (month >= NUM_MONTHS) {
        throw std::out_of_range("Month " + std::to_string(month) + " must be between 0 and 11");
    }
    return probabilities_[hour][month];
}

UtilizationProfile UtilizationProfile::constant(double probability) {
    UtilizationProfile profile;
    for (size_t h = 0; h < NUM_HOURS; ++h) {
        for (size_t m = 0; m < NUM_MONTHS; ++m) {
            profile.set_probability(h, m, probability);
        }
    }
    return profile;
}

UtilizationProfile UtilizationProfile::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw DataError("Cannot open utilisation profile: " + filepath);
    }
    return load_from_csv(file, filepath);
}

UtilizationProfile UtilizationProfile::load_from_csv(std::istream& is,
                                                     const std::string& source_name) {
    UtilizationProfile profile;
    CsvReader reader(is);

    size_t hour = 0;
    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty()) continue;

        std::string where = source_name + " line " + std::to_string(reader.line_number());
        if (hour >= NUM_HOURS) {
            throw DataError(where + ": profile has more than 24 hour rows");
        }
        if (row.size() != NUM_MONTHS) {
            throw DataError(where + ": expected 12 month columns, found " +
                            std::to_string(row.size()));
        }

        for (size_t month = 0; month < NUM_MONTHS; ++month) {
            double p = parse_double(row[month], where + " month " + std::to_string(month));
            if (p < 0.0 || p > 1.0) {
                throw DataError(where + ": probability " + row[month] +
                                " for month " + std::to_string(month) +
                                " is outside [0, 1]");
            }
            profile.probabilities_[hour][month] = p;
        }
        ++hour;
    }

    if (hour != NUM_HOURS) {
        throw DataError(source_name + ": expected 24 hour rows, found " + std::to_string(hour));
    }

    return profile;
}

// ============================================================================
// ProfileSet Implementation
// ============================================================================

void ProfileSet::add(const std::string& device_id, const UtilizationProfile& profile) {
    profiles_[device_id] = profile;
}

bool ProfileSet::contains(const std::string& device_id) const {
    return profiles_.count(device_id) != 0;
}

const UtilizationProfile& ProfileSet::get(const std::string& device_id) const {
    auto it = profiles_.find(device_id);
    if (it == profiles_.end()) {
        throw DataError("No utilisation profile for device: " + device_id);
    }
    return it->second;
}

size_t ProfileSet::size() const {
    return profiles_.size();
}

bool ProfileSet::empty() const {
    return profiles_.empty();
}

std::vector<std::string> ProfileSet::device_ids() const {
    std::vector<std::string> ids;
    ids.reserve(profiles_.size());
    for (const auto& entry : profiles_) {
        ids.push_back(entry.first);
    }
    return ids;
}

std::string ProfileSet::profile_filename(const std::string& device_id) {
    return device_id + "_times.csv";
}

ProfileSet ProfileSet::load_from_directory(const std::string& directory,
                                           const std::vector<std::string>& device_ids) {
    if (!fs::is_directory(directory)) {
        throw DataError("Utilisation profile directory not found: " + directory);
    }

    ProfileSet set;
    for (const auto& id : device_ids) {
        fs::path path = fs::path(directory) / profile_filename(id);
        if (!fs::exists(path)) {
            throw DataError("Device '" + id + "' has no utilisation profile (expected " +
                            path.string() + ")");
        }
        set.add(id, UtilizationProfile::load_from_csv(path.string()));
    }
    return set;
}

std::vector<std::string> ProfileSet::list_directory(const std::string& directory) {
    static const std::string suffix = "_times.csv";

    std::vector<std::string> ids;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        std::string name = entry.path().filename().string();
        if (name.size() > suffix.size() &&
            name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
            ids.push_back(name.substr(0, name.size() - suffix.size()));
        }
    }
    if (ec) {
        throw DataError("Cannot list utilisation profile directory " + directory + ": " +
                        ec.message());
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace loadsim
