#include "qorsense/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace qorsense {

void RunningStats::update(double value) {
    if (count == 0) {
        min = value;
        max = value;
    } else {
        min = std::min(min, value);
        max = std::max(max, value);
    }
    count += 1;
    const double delta = value - mean;
    mean += delta / static_cast<double>(count);
    const double delta2 = value - mean;
    m2 += delta * delta2;
}

double RunningStats::variance() const {
    if (count < 2) {
        return 0.0;
    }
    return std::max(0.0, m2 / static_cast<double>(count));
}

double RunningStats::stddev() const {
    return std::sqrt(variance());
}

double RunningStats::range() const {
    return max - min;
}

RunningStats accumulate_stats(const std::vector<double>& values) {
    RunningStats stats;
    for (double value : values) {
        stats.update(value);
    }
    return stats;
}

double ScaledSeries::restore(double scaled) const {
    return std::ldexp(scaled, exponent);
}

ScaledSeries scale_to_unit(const std::vector<double>& values) {
    ScaledSeries scaled;
    double largest = 0.0;
    for (double value : values) {
        largest = std::max(largest, std::fabs(value));
    }
    if (largest > 0.0 && std::isfinite(largest)) {
        std::frexp(largest, &scaled.exponent);
    }
    scaled.values.reserve(values.size());
    for (double value : values) {
        scaled.values.push_back(std::ldexp(value, -scaled.exponent));
    }
    return scaled;
}

LinearFit fit_line(const std::vector<double>& y) {
    std::vector<double> x(y.size());
    for (std::size_t i = 0; i < x.size(); ++i) {
        x[i] = static_cast<double>(i);
    }
    return fit_line(x, y);
}

LinearFit fit_line(const std::vector<double>& x, const std::vector<double>& y) {
    if (x.size() != y.size()) {
        throw std::invalid_argument("fit_line requires x and y of equal length");
    }
    if (y.empty()) {
        return LinearFit{};
    }
    const auto x_stats = accumulate_stats(x);
    const auto y_stats = accumulate_stats(y);
    if (x.size() < 2 || x_stats.range() == 0.0) {
        return LinearFit{0.0, y_stats.mean, 0.0};
    }
    // Exact zero for a flat series instead of rounding residue from the mean.
    if (y_stats.range() == 0.0) {
        return LinearFit{0.0, y.front(), 0.0};
    }

    double sxx = 0.0;
    double sxy = 0.0;
    for (std::size_t i = 0; i < x.size(); ++i) {
        const double dx = x[i] - x_stats.mean;
        sxx += dx * dx;
        sxy += dx * (y[i] - y_stats.mean);
    }
    const double slope = sxy / sxx;
    const double intercept = y_stats.mean - slope * x_stats.mean;

    double ss_res = 0.0;
    double ss_tot = 0.0;
    for (std::size_t i = 0; i < y.size(); ++i) {
        const double fitted = intercept + slope * x[i];
        ss_res += (y[i] - fitted) * (y[i] - fitted);
        ss_tot += (y[i] - y_stats.mean) * (y[i] - y_stats.mean);
    }
    const double r2 = ss_tot > 0.0 ? std::clamp(1.0 - ss_res / ss_tot, 0.0, 1.0) : 0.0;
    return LinearFit{slope, intercept, r2};
}

double percentile(std::vector<double> values, double q) {
    if (values.empty()) {
        return 0.0;
    }
    std::sort(values.begin(), values.end());
    const double rank = std::clamp(q, 0.0, 100.0) / 100.0 * static_cast<double>(values.size() - 1);
    const auto lower = static_cast<std::size_t>(std::floor(rank));
    const auto upper = std::min(lower + 1, values.size() - 1);
    const double fraction = rank - static_cast<double>(lower);
    return values[lower] + (values[upper] - values[lower]) * fraction;
}

SeriesStatistics describe(const std::vector<double>& values) {
    SeriesStatistics stats;
    if (values.empty()) {
        return stats;
    }
    const auto scaled = scale_to_unit(values);
    const auto running = accumulate_stats(scaled.values);
    stats.count = running.count;
    stats.mean = scaled.restore(running.mean);
    stats.stddev = scaled.restore(running.stddev());
    stats.variance = std::ldexp(running.variance(), 2 * scaled.exponent);
    stats.min = scaled.restore(running.min);
    stats.max = scaled.restore(running.max);
    stats.range = stats.max - stats.min;

    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());
    stats.p25 = percentile(sorted, 25.0);
    stats.p50 = percentile(sorted, 50.0);
    stats.p75 = percentile(sorted, 75.0);
    stats.p90 = percentile(sorted, 90.0);
    stats.p95 = percentile(sorted, 95.0);
    stats.p99 = percentile(sorted, 99.0);
    stats.median = stats.p50;
    return stats;
}

}  // namespace qorsense
