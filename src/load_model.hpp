#ifndef LOADSIM_LOAD_MODEL_HPP
#define LOADSIM_LOAD_MODEL_HPP

#include "device.hpp"
#include "utilization.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace loadsim {

// Static attributes of one device as seen by the sampling core
struct DeviceAttributes {
    double power_w;
    int64_t owned_count;
    bool available;
    std::string type;
};

// LoadModel: the validated, immutable inputs of a simulation run.
//
// Built once at startup from the device catalog and the utilisation profiles,
// then shared read-only (by const reference) with every worker. Profiles are
// stored in catalog order so the sampling loops index devices by position.
class LoadModel {
public:
    // Throws DataError if a catalog device has no profile.
    // Profiles for devices absent from the catalog are dropped.
    LoadModel(DeviceCatalog catalog, const ProfileSet& profiles);

    // Device ids in catalog order
    std::vector<std::string> get_device_list() const;

    // Throws DataError for an unknown id
    DeviceAttributes get_device_attributes(const std::string& id) const;

    // Probability that one unit of the device is on; throws DataError for an
    // unknown id and std::out_of_range for a bad hour or month
    double get_utilization(const std::string& id, size_t hour, size_t month) const;

    // Positional access used by the sampling loops
    size_t device_count() const { return catalog_.size(); }
    const Device& device(size_t index) const { return catalog_.at(index); }
    const UtilizationProfile& profile(size_t index) const;

    const DeviceCatalog& catalog() const { return catalog_; }

    // Ids of profiles that were supplied but matched no catalog device
    const std::vector<std::string>& unused_profiles() const { return unused_profiles_; }

    // Expected system load (kW) for an hour and month:
    // sum over devices of effective_count * p * power_w / 1000
    double expected_load_kw(size_t hour, size_t month) const;

private:
    DeviceCatalog catalog_;
    std::vector<UtilizationProfile> profiles_;
    std::vector<std::string> unused_profiles_;

    size_t index_of(const std::string& id) const;
};

} // namespace loadsim

#endif // LOADSIM_LOAD_MODEL_HPP
