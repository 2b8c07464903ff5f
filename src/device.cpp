#include "device.hpp"
#include "errors.hpp"
#include "io/csv_reader.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <initializer_list>
#include <utility>

namespace loadsim {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Locate a column by any of its accepted names, -1 if absent
int find_column(const std::vector<std::string>& header,
                std::initializer_list<const char*> names) {
    for (size_t i = 0; i < header.size(); ++i) {
        std::string h = to_lower(header[i]);
        for (const char* name : names) {
            if (h == name) {
                return static_cast<int>(i);
            }
        }
    }
    return -1;
}

double round_to(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

} // anonymous namespace

// ============================================================================
// Device Implementation
// ============================================================================

Device::Device()
    : power_w(0.0), owned_count(0), available(true) {}

Device::Device(std::string id_, double power_w_, int64_t owned_count_,
               bool available_, std::string type_)
    : id(std::move(id_)), power_w(power_w_), owned_count(owned_count_),
      available(available_), type(std::move(type_)) {}

int64_t Device::effective_owned_count() const {
    return available ? owned_count : 0;
}

void Device::validate() const {
    if (id.empty()) {
        throw DataError("Device id must not be empty");
    }
    if (!std::isfinite(power_w) || power_w < 0.0) {
        throw DataError("Device '" + id + "' has negative or non-finite power: " +
                        std::to_string(power_w));
    }
    if (owned_count < 0) {
        throw DataError("Device '" + id + "' has negative owned count: " +
                        std::to_string(owned_count));
    }
}

bool Device::operator==(const Device& other) const {
    return id == other.id &&
           power_w == other.power_w &&
           owned_count == other.owned_count &&
           available == other.available &&
           type == other.type &&
           attributes == other.attributes;
}

bool parse_availability(const std::string& value) {
    std::string v = to_lower(value);
    if (v == "y" || v == "yes" || v == "true" || v == "1") {
        return true;
    }
    if (v == "n" || v == "no" || v == "false" || v == "0") {
        return false;
    }
    throw DataError("Unknown availability flag '" + value + "' (expected Y or N)");
}

// ============================================================================
// DeviceCatalog Implementation
// ============================================================================

DeviceCatalog::DeviceCatalog() = default;

void DeviceCatalog::add(const Device& device) {
    add(Device(device));
}

void DeviceCatalog::add(Device&& device) {
    device.validate();
    if (index_.count(device.id) != 0) {
        throw DataError("Duplicate device id: " + device.id);
    }
    index_.emplace(device.id, devices_.size());
    devices_.push_back(std::move(device));
}

const Device& DeviceCatalog::get(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw DataError("Unknown device: " + id);
    }
    return devices_[it->second];
}

const Device& DeviceCatalog::at(size_t index) const {
    if (index >= devices_.size()) {
        throw std::out_of_range("Device index out of range");
    }
    return devices_[index];
}

bool DeviceCatalog::contains(const std::string& id) const {
    return index_.count(id) != 0;
}

size_t DeviceCatalog::size() const {
    return devices_.size();
}

bool DeviceCatalog::empty() const {
    return devices_.empty();
}

std::vector<std::string> DeviceCatalog::device_ids() const {
    std::vector<std::string> ids;
    ids.reserve(devices_.size());
    for (const auto& device : devices_) {
        ids.push_back(device.id);
    }
    return ids;
}

std::vector<std::string> DeviceCatalog::types() const {
    std::vector<std::string> result;
    for (const auto& device : devices_) {
        if (std::find(result.begin(), result.end(), device.type) == result.end()) {
            result.push_back(device.type);
        }
    }
    return result;
}

void DeviceCatalog::reserve(size_t count) {
    devices_.reserve(count);
    index_.reserve(count);
}

DeviceCatalog DeviceCatalog::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw DataError("Cannot open device list: " + filepath);
    }
    return load_from_csv(file, filepath);
}

DeviceCatalog DeviceCatalog::load_from_csv(std::istream& is, const std::string& source_name) {
    CsvReader reader(is);

    auto header = reader.read_row();
    if (header.empty()) {
        throw DataError(source_name + ": empty device list");
    }

    int id_col = find_column(header, {"device", "id", "name"});
    int power_col = find_column(header, {"power (w)", "power_w", "power"});
    int number_col = find_column(header, {"number", "owned_count", "count"});
    int available_col = find_column(header, {"available", "availability"});
    int type_col = find_column(header, {"type", "device_type"});

    // The original device list is indexed by its first column
    if (id_col < 0) {
        id_col = 0;
    }
    if (power_col < 0) {
        throw DataError(source_name + ": device list requires a 'Power (W)' column");
    }
    if (number_col < 0) {
        throw DataError(source_name + ": device list requires a 'Number' column");
    }

    DeviceCatalog catalog;

    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty()) continue;

        std::string where = source_name + " line " + std::to_string(reader.line_number());
        if (row.size() < header.size()) {
            throw DataError(where + ": expected " + std::to_string(header.size()) +
                            " columns, found " + std::to_string(row.size()));
        }

        Device device;
        device.id = row[id_col];
        device.power_w = round_to(parse_double(row[power_col], where + " power"), 3);
        device.owned_count = parse_integer(row[number_col], where + " number");
        if (available_col >= 0) {
            try {
                device.available = parse_availability(row[available_col]);
            } catch (const DataError& e) {
                throw DataError(where + ": " + e.what());
            }
        }
        if (type_col >= 0) {
            device.type = row[type_col];
        }

        for (size_t i = 0; i < header.size(); ++i) {
            int col = static_cast<int>(i);
            if (col == id_col || col == power_col || col == number_col ||
                col == available_col || col == type_col) {
                continue;
            }
            device.attributes[header[i]] = row[i];
        }

        try {
            catalog.add(std::move(device));
        } catch (const DataError& e) {
            throw DataError(where + ": " + e.what());
        }
    }

    return catalog;
}

} // namespace loadsim
