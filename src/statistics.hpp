#ifndef LOADSIM_STATISTICS_HPP
#define LOADSIM_STATISTICS_HPP

#include "sampler.hpp"
#include <array>
#include <cstddef>
#include <optional>
#include <vector>

namespace loadsim {

class MonthEnsemble;

// Arithmetic mean, 0 for an empty input
double calculate_mean(const std::vector<double>& values);

// Population standard deviation (divides by n), 0 for fewer than two values
double calculate_std_dev(const std::vector<double>& values, double mean);

// Percentile by linear interpolation between order statistics: position
// p/100 * (n - 1) in the sorted values. p = 0 gives the minimum, p = 100 the
// maximum. values must be sorted ascending; p must be in [0, 100].
double calculate_percentile(const std::vector<double>& sorted_values, double p);

// std_dev / mean, or no value when the mean is 0 (the ratio is undefined)
std::optional<double> coefficient_of_variation(double mean, double std_dev);

// Statistics of one month, one entry per hour
struct MonthlySummary {
    size_t month;
    std::array<double, HOURS_PER_DAY> mean;
    std::array<double, HOURS_PER_DAY> std_dev;
    std::array<std::optional<double>, HOURS_PER_DAY> coefficient_of_variation;
    std::array<double, HOURS_PER_DAY> percentile;

    MonthlySummary();

    // Hours whose coefficient of variation is undefined
    size_t undefined_cv_count() const;
};

// Reduce a month's ensemble (24 x trials) hour by hour
MonthlySummary summarize_month(const MonthEnsemble& ensemble, double percentile);

// Hours (rows) by months (columns)
using HourMonthTable = std::array<std::array<double, MONTHS_PER_YEAR>, HOURS_PER_DAY>;
using OptionalHourMonthTable =
    std::array<std::array<std::optional<double>, MONTHS_PER_YEAR>, HOURS_PER_DAY>;

// Year-wide tables assembled from the twelve monthly summaries
struct YearSummary {
    double percentile_level;
    HourMonthTable mean;
    HourMonthTable std_dev;
    OptionalHourMonthTable coefficient_of_variation;
    HourMonthTable percentile;

    YearSummary();

    // Copy a month's vectors into column summary.month
    void set_month(const MonthlySummary& summary);

    size_t undefined_cv_count() const;
};

// Five-number summary plus mean, as drawn by a box plot
struct BoxplotStats {
    double min;
    double q1;
    double median;
    double q3;
    double max;
    double mean;

    BoxplotStats();
};

// Box-plot statistics using the same percentile method as the summaries.
// An empty input gives all zeros.
BoxplotStats calculate_boxplot(const std::vector<double>& values);

} // namespace loadsim

#endif // LOADSIM_STATISTICS_HPP
