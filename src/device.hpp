#ifndef LOADSIM_DEVICE_HPP
#define LOADSIM_DEVICE_HPP

#include <cstdint>
#include <istream>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace loadsim {

// Device: one appliance type owned by the community
struct Device {
    std::string id;           // Unique name, e.g. "light_bulb"
    double power_w;           // Power draw of one unit in watts
    int64_t owned_count;      // Total units held by the community
    bool available;           // If false the device is ignored (effective count 0)
    std::string type;         // Grouping label, e.g. "Domestic"
    std::map<std::string, std::string> attributes;  // Extra columns from the device list

    Device();
    Device(std::string id, double power_w, int64_t owned_count,
           bool available = true, std::string type = "");

    // Number of units that can be switched on: owned_count, or 0 when unavailable
    int64_t effective_owned_count() const;

    // Throws DataError on negative power or negative owned count
    void validate() const;

    bool operator==(const Device& other) const;
};

// DeviceCatalog: ordered, immutable-after-load set of devices
class DeviceCatalog {
public:
    DeviceCatalog();

    // Throws DataError on duplicate id or invalid device
    void add(const Device& device);
    void add(Device&& device);

    // Lookup by id, throws DataError when the id is unknown
    const Device& get(const std::string& id) const;
    const Device& at(size_t index) const;
    bool contains(const std::string& id) const;

    size_t size() const;
    bool empty() const;

    const std::vector<Device>& devices() const { return devices_; }

    // Device ids in insertion (file) order
    std::vector<std::string> device_ids() const;

    // Distinct device types in first-seen order
    std::vector<std::string> types() const;

    void reserve(size_t count);

    // Load the device list: header row, then one row per device.
    // Columns: Device, Power (W), Number, Available (Y/N), Type
    static DeviceCatalog load_from_csv(const std::string& filepath);
    static DeviceCatalog load_from_csv(std::istream& is,
                                       const std::string& source_name = "<stream>");

private:
    std::vector<Device> devices_;
    std::unordered_map<std::string, size_t> index_;
};

// Parse an availability flag: Y/N, yes/no, true/false, 1/0 (case-insensitive)
bool parse_availability(const std::string& value);

} // namespace loadsim

#endif // LOADSIM_DEVICE_HPP
