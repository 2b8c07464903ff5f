#ifndef LOADSIM_SAMPLER_HPP
#define LOADSIM_SAMPLER_HPP

#include "device.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <random>
#include <string>

namespace loadsim {

class LoadModel;

// Random source used by every sampling call. Always passed explicitly;
// there is no process-wide generator.
using RandomEngine = std::mt19937_64;

// Device power (W) times active units gives watts; the system load is in kW.
// One hour at P kW is P kWh, so the same factor serves the detailed records.
constexpr double WATTS_TO_KILOWATTS = 0.001;

constexpr size_t HOURS_PER_DAY = 24;
constexpr size_t MONTHS_PER_YEAR = 12;

// Three-letter month name ("Jan".."Dec"); throws std::out_of_range past 11
std::string month_name(size_t month);

// Load of one device for each hour of a day, in kW
using DeviceDayLoad = std::array<double, HOURS_PER_DAY>;

// Draw the number of active units: Binomial(owned_count, probability).
// p = 0 and p = 1 still go through the distribution.
// Throws std::invalid_argument for a negative count or p outside [0, 1].
int64_t sample_active_units(int64_t owned_count, double probability, RandomEngine& rng);

// Active units of the device (effective owned count) converted to kW
double sample_device_load_kw(const Device& device, double probability, RandomEngine& rng);

// Seed for one (month, trial, device) stream, derived from the run seed
// with splitmix64 so neighbouring coordinates give unrelated streams.
// Streams are keyed by coordinates, never by execution order.
uint64_t derive_stream_seed(uint64_t run_seed, size_t month, size_t trial, size_t device_index);

// Sample one device for all 24 hours of a month in one trial.
// Uses its own stream from derive_stream_seed and draws hours in order 0..23.
DeviceDayLoad sample_device_day(const LoadModel& model, size_t device_index,
                                size_t month, size_t trial, uint64_t run_seed);

} // namespace loadsim

#endif // LOADSIM_SAMPLER_HPP
