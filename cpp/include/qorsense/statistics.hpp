#ifndef QORSENSE_STATISTICS_HPP
#define QORSENSE_STATISTICS_HPP

#include <cstddef>
#include <vector>

namespace qorsense {

// Welford accumulator; variance() is the population variance.
struct RunningStats {
    double mean = 0.0;
    double m2 = 0.0;
    double min = 0.0;
    double max = 0.0;
    std::size_t count = 0;

    void update(double value);
    double variance() const;
    double stddev() const;
    double range() const;
};

RunningStats accumulate_stats(const std::vector<double>& values);

struct LinearFit {
    double slope = 0.0;
    double intercept = 0.0;
    double r2 = 0.0;

    double at(double x) const { return intercept + slope * x; }
};

// Ordinary least squares of y against its sample index 0..n-1.
LinearFit fit_line(const std::vector<double>& y);
LinearFit fit_line(const std::vector<double>& x, const std::vector<double>& y);

struct SeriesStatistics {
    std::size_t count = 0;
    double mean = 0.0;
    double stddev = 0.0;
    double variance = 0.0;
    double min = 0.0;
    double max = 0.0;
    double median = 0.0;
    double range = 0.0;
    double p25 = 0.0;
    double p50 = 0.0;
    double p75 = 0.0;
    double p90 = 0.0;
    double p95 = 0.0;
    double p99 = 0.0;
};

// Values divided by a power of two so that max |v| lies in [0.5, 1). Power-of-two scaling is
// exact, and moments of the scaled values cannot overflow for any finite input.
struct ScaledSeries {
    std::vector<double> values;
    int exponent = 0;

    // Back to reading units; may still overflow when the true result exceeds the double range.
    double restore(double scaled) const;
};

ScaledSeries scale_to_unit(const std::vector<double>& values);

// Linear interpolation between order statistics; q in [0, 100].
double percentile(std::vector<double> values, double q);

SeriesStatistics describe(const std::vector<double>& values);

}  // namespace qorsense

#endif  // QORSENSE_STATISTICS_HPP
