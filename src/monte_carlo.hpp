#ifndef LOADSIM_MONTE_CARLO_HPP
#define LOADSIM_MONTE_CARLO_HPP

#include "aggregator.hpp"
#include "load_model.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace loadsim {

// MonthEnsemble: system load of every trial of one month, a 24 x trials
// matrix stored hour-major so each hour's row is contiguous
class MonthEnsemble {
public:
    MonthEnsemble(size_t month, size_t trials);

    size_t month() const { return month_; }
    size_t trials() const { return trials_; }
    static constexpr size_t hours() { return HOURS_PER_DAY; }

    double get(size_t hour, size_t trial) const;
    void set(size_t hour, size_t trial, double load_kw);

    // Store a whole trial (column)
    void set_trial(size_t trial, const TrialLoadVector& load);
    TrialLoadVector trial_load(size_t trial) const;

    // All trial values of one hour (row)
    std::vector<double> hour_values(size_t hour) const;

    // Daily energy (kWh) of each trial, in trial order
    std::vector<double> daily_totals_kwh() const;

private:
    size_t month_;
    size_t trials_;
    std::vector<double> loads_;  // loads_[hour * trials_ + trial]

    void check_index(size_t hour, size_t trial) const;
};

// Run `trials` independent trials of one month and collect them by trial
// index. With OpenMP the trials run in parallel on `threads` threads
// (0 = runtime default); the result is identical either way.
MonthEnsemble run_month_ensemble(const LoadModel& model, size_t month, size_t trials,
                                 uint64_t run_seed, int threads = 0);

} // namespace loadsim

#endif // LOADSIM_MONTE_CARLO_HPP
