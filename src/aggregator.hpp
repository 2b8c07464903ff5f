#ifndef LOADSIM_AGGREGATOR_HPP
#define LOADSIM_AGGREGATOR_HPP

#include "load_model.hpp"
#include "sampler.hpp"
#include <array>
#include <cstddef>
#include <cstdint>

namespace loadsim {

// System load for one trial of one month, kW by hour
using TrialLoadVector = std::array<double, HOURS_PER_DAY>;

// Sum the sampled load of every device in the model for one month and trial.
// Each device draws from its own (month, trial, device) stream, so the result
// depends only on the run seed and the coordinates.
TrialLoadVector simulate_trial(const LoadModel& model, size_t month, size_t trial,
                               uint64_t run_seed);

// Daily energy (kWh) of a trial: one-hour slots, so the sum of hourly kW
double daily_energy_kwh(const TrialLoadVector& load);

} // namespace loadsim

#endif // LOADSIM_AGGREGATOR_HPP
