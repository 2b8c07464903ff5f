#include "load_model.hpp"
#include "errors.hpp"
#include "sampler.hpp"
#include <stdexcept>
#include <utility>

namespace loadsim {

LoadModel::LoadModel(DeviceCatalog catalog, const ProfileSet& profiles)
    : catalog_(std::move(catalog)) {
    profiles_.reserve(catalog_.size());
    for (const auto& device : catalog_.devices()) {
        if (!profiles.contains(device.id)) {
            throw DataError("Device '" + device.id + "' is missing from the utilisation profiles");
        }
        profiles_.push_back(profiles.get(device.id));
    }

    for (const auto& id : profiles.device_ids()) {
        if (!catalog_.contains(id)) {
            unused_profiles_.push_back(id);
        }
    }
}

std::vector<std::string> LoadModel::get_device_list() const {
    return catalog_.device_ids();
}

DeviceAttributes LoadModel::get_device_attributes(const std::string& id) const {
    const Device& d = catalog_.get(id);
    return DeviceAttributes{d.power_w, d.owned_count, d.available, d.type};
}

double LoadModel::get_utilization(const std::string& id, size_t hour, size_t month) const {
    return profiles_[index_of(id)].get_probability(hour, month);
}

const UtilizationProfile& LoadModel::profile(size_t index) const {
    if (index >= profiles_.size()) {
        throw std::out_of_range("Device index out of range");
    }
    return profiles_[index];
}

double LoadModel::expected_load_kw(size_t hour, size_t month) const {
    double total = 0.0;
    for (size_t i = 0; i < catalog_.size(); ++i) {
        const Device& d = catalog_.at(i);
        total += static_cast<double>(d.effective_owned_count()) *
                 profiles_[i].get_probability(hour, month) *
                 d.power_w * WATTS_TO_KILOWATTS;
    }
    return total;
}

size_t LoadModel::index_of(const std::string& id) const {
    const auto& devices = catalog_.devices();
    for (size_t i = 0; i < devices.size(); ++i) {
        if (devices[i].id == id) {
            return i;
        }
    }
    throw DataError("Unknown device: " + id);
}

} // namespace loadsim
