#include "simulation.hpp"
#include "logger.hpp"
#include "monte_carlo.hpp"
#include <chrono>

namespace loadsim {

SimulationResult::SimulationResult()
    : trials(0),
      device_count(0),
      seed(0),
      execution_time_ms(0.0),
      undefined_cv_cells(0) {}

bool SimulationResult::has_daily_totals() const {
    for (const auto& month : daily_totals_kwh) {
        if (!month.empty()) {
            return true;
        }
    }
    return false;
}

SimulationResult run_simulation(const LoadModel& model, const SimulationConfig& config) {
    config.validate();

    Logger& logger = Logger::get_instance();
    auto start_time = std::chrono::high_resolution_clock::now();

    SimulationResult result;
    result.trials = config.trials;
    result.device_count = model.device_count();
    result.seed = config.seed;
    result.summary.percentile_level = config.percentile;

    for (size_t month = 0; month < MONTHS_PER_YEAR; ++month) {
        auto month_start = std::chrono::high_resolution_clock::now();

        MonthEnsemble ensemble =
            run_month_ensemble(model, month, config.trials, config.seed, config.threads);

        MonthlySummary summary = summarize_month(ensemble, config.percentile);
        result.summary.set_month(summary);

        for (size_t hour = 0; hour < HOURS_PER_DAY; ++hour) {
            if (!summary.coefficient_of_variation[hour]) {
                logger.log_degenerate_statistic(month, hour);
            }
        }

        if (config.daily_totals) {
            result.daily_totals_kwh[month] = ensemble.daily_totals_kwh();
        }

        auto month_end = std::chrono::high_resolution_clock::now();
        logger.log_month_complete(
            month, config.trials,
            std::chrono::duration<double, std::milli>(month_end - month_start).count(),
            summary.undefined_cv_count());
    }

    result.undefined_cv_cells = result.summary.undefined_cv_count();

    auto end_time = std::chrono::high_resolution_clock::now();
    result.execution_time_ms = std::chrono::duration<double, std::milli>(
        end_time - start_time).count();

    return result;
}

} // namespace loadsim
