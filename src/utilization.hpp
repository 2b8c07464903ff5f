#ifndef LOADSIM_UTILIZATION_HPP
#define LOADSIM_UTILIZATION_HPP

#include <array>
#include <cstddef>
#include <istream>
#include <map>
#include <string>
#include <vector>

namespace loadsim {

// UtilizationProfile: probability that one unit of a device is on,
// by hour of day (0-23) and month of year (0-11)
class UtilizationProfile {
public:
    static constexpr size_t NUM_HOURS = 24;
    static constexpr size_t NUM_MONTHS = 12;

    UtilizationProfile();

    // Set/get probability; throws std::out_of_range for a bad hour or month
    // and DataError for a probability outside [0, 1]
    void set_probability(size_t hour, size_t month, double probability);
    double get_probability(size_t hour, size_t month) const;

    // Same probability for every hour of every month
    static UtilizationProfile constant(double probability);

    // Load from CSV: no header, 24 rows (hours) by 12 columns (months)
    static UtilizationProfile load_from_csv(const std::string& filepath);
    static UtilizationProfile load_from_csv(std::istream& is,
                                            const std::string& source_name = "<stream>");

private:
    // probabilities_[hour][month]
    std::array<std::array<double, NUM_MONTHS>, NUM_HOURS> probabilities_;
};

// ProfileSet: utilisation profiles keyed by device id
class ProfileSet {
public:
    void add(const std::string& device_id, const UtilizationProfile& profile);

    bool contains(const std::string& device_id) const;

    // Throws DataError when the device has no profile
    const UtilizationProfile& get(const std::string& device_id) const;

    size_t size() const;
    bool empty() const;

    std::vector<std::string> device_ids() const;

    // Load "<device>_times.csv" for every requested device from a directory.
    // A missing file is a DataError naming the device.
    static ProfileSet load_from_directory(const std::string& directory,
                                          const std::vector<std::string>& device_ids);

    static std::string profile_filename(const std::string& device_id);

    // Device ids of every "<device>_times.csv" in a directory, sorted
    static std::vector<std::string> list_directory(const std::string& directory);

private:
    std::map<std::string, UtilizationProfile> profiles_;
};

} // namespace loadsim

#endif // LOADSIM_UTILIZATION_HPP
