#include "statistics.hpp"
#include "monte_carlo.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>

namespace loadsim {

// ============================================================================
// Statistics Helper Functions
// ============================================================================

double calculate_mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}

double calculate_std_dev(const std::vector<double>& values, double mean) {
    if (values.size() < 2) {
        return 0.0;
    }
    double sum_sq_diff = 0.0;
    for (double v : values) {
        double diff = v - mean;
        sum_sq_diff += diff * diff;
    }
    return std::sqrt(sum_sq_diff / static_cast<double>(values.size()));
}

double calculate_percentile(const std::vector<double>& sorted_values, double p) {
    if (p < 0.0 || p > 100.0) {
        throw std::invalid_argument("Percentile must be between 0 and 100, got " +
                                    std::to_string(p));
    }
    if (sorted_values.empty()) {
        return 0.0;
    }
    if (sorted_values.size() == 1) {
        return sorted_values[0];
    }

    double n = static_cast<double>(sorted_values.size());
    double pos = (p / 100.0) * (n - 1);

    size_t lower_idx = static_cast<size_t>(std::floor(pos));
    size_t upper_idx = static_cast<size_t>(std::ceil(pos));

    if (lower_idx == upper_idx || upper_idx >= sorted_values.size()) {
        return sorted_values[lower_idx];
    }

    double frac = pos - static_cast<double>(lower_idx);
    return sorted_values[lower_idx] * (1.0 - frac) + sorted_values[upper_idx] * frac;
}

std::optional<double> coefficient_of_variation(double mean, double std_dev) {
    if (mean == 0.0) {
        return std::nullopt;
    }
    return std_dev / mean;
}

// ============================================================================
// MonthlySummary Implementation
// ============================================================================

MonthlySummary::MonthlySummary()
    : month(0) {
    mean.fill(0.0);
    std_dev.fill(0.0);
    coefficient_of_variation.fill(std::nullopt);
    percentile.fill(0.0);
}

size_t MonthlySummary::undefined_cv_count() const {
    return static_cast<size_t>(std::count_if(
        coefficient_of_variation.begin(), coefficient_of_variation.end(),
        [](const std::optional<double>& cv) { return !cv.has_value(); }));
}

MonthlySummary summarize_month(const MonthEnsemble& ensemble, double percentile) {
    MonthlySummary summary;
    summary.month = ensemble.month();

    for (size_t hour = 0; hour < HOURS_PER_DAY; ++hour) {
        std::vector<double> values = ensemble.hour_values(hour);

        double mean = calculate_mean(values);
        double std_dev = calculate_std_dev(values, mean);

        std::sort(values.begin(), values.end());

        summary.mean[hour] = mean;
        summary.std_dev[hour] = std_dev;
        summary.coefficient_of_variation[hour] = coefficient_of_variation(mean, std_dev);
        summary.percentile[hour] = calculate_percentile(values, percentile);
    }

    return summary;
}

// ============================================================================
// YearSummary Implementation
// ============================================================================

YearSummary::YearSummary()
    : percentile_level(0.0) {
    for (size_t h = 0; h < HOURS_PER_DAY; ++h) {
        mean[h].fill(0.0);
        std_dev[h].fill(0.0);
        coefficient_of_variation[h].fill(std::nullopt);
        percentile[h].fill(0.0);
    }
}

void YearSummary::set_month(const MonthlySummary& summary) {
    if (summary.month >= MONTHS_PER_YEAR) {
        throw std::out_of_range("Month " + std::to_string(summary.month) +
                                " must be between 0 and 11");
    }
    size_t m = summary.month;
    for (size_t h = 0; h < HOURS_PER_DAY; ++h) {
        mean[h][m] = summary.mean[h];
        std_dev[h][m] = summary.std_dev[h];
        coefficient_of_variation[h][m] = summary.coefficient_of_variation[h];
        percentile[h][m] = summary.percentile[h];
    }
}

size_t YearSummary::undefined_cv_count() const {
    size_t count = 0;
    for (const auto& row : coefficient_of_variation) {
        for (const auto& cell : row) {
            if (!cell) {
                ++count;
            }
        }
    }
    return count;
}

// ============================================================================
// Box-plot statistics
// ============================================================================

BoxplotStats::BoxplotStats()
    : min(0.0), q1(0.0), median(0.0), q3(0.0), max(0.0), mean(0.0) {}

BoxplotStats calculate_boxplot(const std::vector<double>& values) {
    BoxplotStats stats;
    if (values.empty()) {
        return stats;
    }

    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());

    stats.min = sorted.front();
    stats.q1 = calculate_percentile(sorted, 25.0);
    stats.median = calculate_percentile(sorted, 50.0);
    stats.q3 = calculate_percentile(sorted, 75.0);
    stats.max = sorted.back();
    stats.mean = calculate_mean(sorted);
    return stats;
}

} // namespace loadsim
