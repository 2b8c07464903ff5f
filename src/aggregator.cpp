#include "aggregator.hpp"
#include <numeric>
#include <stdexcept>
#include <string>

namespace loadsim {

TrialLoadVector simulate_trial(const LoadModel& model, size_t month, size_t trial,
                               uint64_t run_seed) {
    if (month >= MONTHS_PER_YEAR) {
        throw std::out_of_range("Month " + std::to_string(month) + " must be between 0 and 11");
    }

    TrialLoadVector system_load{};
    for (size_t d = 0; d < model.device_count(); ++d) {
        DeviceDayLoad device_load = sample_device_day(model, d, month, trial, run_seed);
        for (size_t hour = 0; hour < HOURS_PER_DAY; ++hour) {
            system_load[hour] += device_load[hour];
        }
    }
    return system_load;
}

double daily_energy_kwh(const TrialLoadVector& load) {
    return std::accumulate(load.begin(), load.end(), 0.0);
}

} // namespace loadsim
