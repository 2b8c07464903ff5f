#ifndef LOADSIM_SIMULATION_HPP
#define LOADSIM_SIMULATION_HPP

#include "load_model.hpp"
#include "simulation_config.hpp"
#include "statistics.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace loadsim {

// Result of a full-year simulation (12 months x trials x devices)
struct SimulationResult {
    YearSummary summary;

    // Daily energy (kWh) of every trial, per month. Filled only when
    // SimulationConfig::daily_totals is set.
    std::array<std::vector<double>, MONTHS_PER_YEAR> daily_totals_kwh;

    size_t trials;
    size_t device_count;
    uint64_t seed;

    // Execution metrics
    double execution_time_ms;

    // Hours of the year whose coefficient of variation is undefined
    size_t undefined_cv_cells;

    bool has_daily_totals() const;

    SimulationResult();
};

// Run the Monte Carlo simulation for all twelve months.
//
// For each month:
//   1. Run config.trials independent trials (parallel with OpenMP)
//   2. Summarize the month's 24 x trials ensemble
//   3. Keep the trials' daily totals if requested, then drop the ensemble
//
// Throws ConfigurationError if config is invalid, before any sampling.
SimulationResult run_simulation(const LoadModel& model, const SimulationConfig& config);

} // namespace loadsim

#endif // LOADSIM_SIMULATION_HPP
