#include "sampler.hpp"
#include "load_model.hpp"
#include <stdexcept>
#include <string>

namespace loadsim {

namespace {

uint64_t splitmix64(uint64_t x) {
    x += 0x9E3779B97F4A7C15ULL;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
    return x ^ (x >> 31);
}

const char* const MONTH_NAMES[MONTHS_PER_YEAR] = {
    "Jan", "Feb", "Mar", "Apr", "May", "Jun",
    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
};

} // anonymous namespace

std::string month_name(size_t month) {
    if (month >= MONTHS_PER_YEAR) {
        throw std::out_of_range("Month " + std::to_string(month) + " must be between 0 and 11");
    }
    return MONTH_NAMES[month];
}

int64_t sample_active_units(int64_t owned_count, double probability, RandomEngine& rng) {
    if (owned_count < 0) {
        throw std::invalid_argument("Owned count must be non-negative, got " +
                                    std::to_string(owned_count));
    }
    if (!(probability >= 0.0 && probability <= 1.0)) {
        throw std::invalid_argument("Probability must be between 0.0 and 1.0, got " +
                                    std::to_string(probability));
    }

    std::binomial_distribution<int64_t> binomial(owned_count, probability);
    return binomial(rng);
}

double sample_device_load_kw(const Device& device, double probability, RandomEngine& rng) {
    int64_t active = sample_active_units(device.effective_owned_count(), probability, rng);
    return static_cast<double>(active) * device.power_w * WATTS_TO_KILOWATTS;
}

uint64_t derive_stream_seed(uint64_t run_seed, size_t month, size_t trial, size_t device_index) {
    uint64_t h = splitmix64(run_seed);
    h = splitmix64(h ^ static_cast<uint64_t>(month));
    h = splitmix64(h ^ static_cast<uint64_t>(trial));
    h = splitmix64(h ^ static_cast<uint64_t>(device_index));
    return h;
}

DeviceDayLoad sample_device_day(const LoadModel& model, size_t device_index,
                                size_t month, size_t trial, uint64_t run_seed) {
    const Device& device = model.device(device_index);
    const UtilizationProfile& profile = model.profile(device_index);

    RandomEngine rng(derive_stream_seed(run_seed, month, trial, device_index));

    DeviceDayLoad load{};
    for (size_t hour = 0; hour < HOURS_PER_DAY; ++hour) {
        load[hour] = sample_device_load_kw(device, profile.get_probability(hour, month), rng);
    }
    return load;
}

} // namespace loadsim
