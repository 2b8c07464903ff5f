#include "monte_carlo.hpp"
#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace loadsim {

// ============================================================================
// MonthEnsemble Implementation
// ============================================================================

MonthEnsemble::MonthEnsemble(size_t month, size_t trials)
    : month_(month), trials_(trials), loads_(HOURS_PER_DAY * trials, 0.0) {
    if (month >= MONTHS_PER_YEAR) {
        throw std::out_of_range("Month " + std::to_string(month) + " must be between 0 and 11");
    }
}

void MonthEnsemble::check_index(size_t hour, size_t trial) const {
    if (hour >= HOURS_PER_DAY) {
        throw std::out_of_range("Hour " + std::to_string(hour) + " must be between 0 and 23");
    }
    if (trial >= trials_) {
        throw std::out_of_range("Trial index " + std::to_string(trial) + " out of range");
    }
}

double MonthEnsemble::get(size_t hour, size_t trial) const {
    check_index(hour, trial);
    return loads_[hour * trials_ + trial];
}

void MonthEnsemble::set(size_t hour, size_t trial, double load_kw) {
    check_index(hour, trial);
    loads_[hour * trials_ + trial] = load_kw;
}

void MonthEnsemble::set_trial(size_t trial, const TrialLoadVector& load) {
    check_index(0, trial);
    for (size_t hour = 0; hour < HOURS_PER_DAY; ++hour) {
        loads_[hour * trials_ + trial] = load[hour];
    }
}

TrialLoadVector MonthEnsemble::trial_load(size_t trial) const {
    check_index(0, trial);
    TrialLoadVector load{};
    for (size_t hour = 0; hour < HOURS_PER_DAY; ++hour) {
        load[hour] = loads_[hour * trials_ + trial];
    }
    return load;
}

std::vector<double> MonthEnsemble::hour_values(size_t hour) const {
    check_index(hour, 0);
    auto begin = loads_.begin() + static_cast<std::ptrdiff_t>(hour * trials_);
    return std::vector<double>(begin, begin + static_cast<std::ptrdiff_t>(trials_));
}

std::vector<double> MonthEnsemble::daily_totals_kwh() const {
    std::vector<double> totals(trials_, 0.0);
    for (size_t hour = 0; hour < HOURS_PER_DAY; ++hour) {
        for (size_t t = 0; t < trials_; ++t) {
            totals[t] += loads_[hour * trials_ + t];
        }
    }
    return totals;
}

// ============================================================================
// Monte Carlo loop
// ============================================================================

MonthEnsemble run_month_ensemble(const LoadModel& model, size_t month, size_t trials,
                                 uint64_t run_seed, int threads) {
    if (trials == 0) {
        throw std::invalid_argument("Number of trials must be greater than 0");
    }

    MonthEnsemble ensemble(month, trials);

#ifdef HAVE_OPENMP
    // Exceptions must not escape the parallel region; keep the first one
    std::exception_ptr first_error;
    int num_threads = threads > 0 ? threads : omp_get_max_threads();
    long long trial_count = static_cast<long long>(trials);

    #pragma omp parallel for schedule(dynamic, 16) num_threads(num_threads)
    for (long long t = 0; t < trial_count; ++t) {
        try {
            TrialLoadVector load = simulate_trial(model, month, static_cast<size_t>(t), run_seed);
            ensemble.set_trial(static_cast<size_t>(t), load);
        } catch (...) {
            #pragma omp critical
            {
                if (!first_error) {
                    first_error = std::current_exception();
                }
            }
        }
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
#else
    (void)threads;
    for (size_t t = 0; t < trials; ++t) {
        ensemble.set_trial(t, simulate_trial(model, month, t, run_seed));
    }
#endif

    return ensemble;
}

} // namespace loadsim
