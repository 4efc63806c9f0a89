#ifndef QORSENSE_DESCRIPTORS_HPP
#define QORSENSE_DESCRIPTORS_HPP

#include <cstddef>
#include <vector>

#include "qorsense/statistics.hpp"

namespace qorsense {

constexpr double kSnrCeilingDb = 100.0;
constexpr double kNeutralHurst = 0.5;

// Every calculator is a pure function of the cleaned values and never throws on
// degenerate (flat, very short) input; it returns its documented neutral value instead.
// Arithmetic runs on a power-of-two rescaled copy (see scale_to_unit), so large finite
// readings do not overflow intermediate sums.

// Mean offset of the series from `reference`.
double calc_bias(const std::vector<double>& values, double reference = 0.0);

// OLS drift per sample. Flat series -> 0.
double calc_slope(const std::vector<double>& values);

struct NoiseEstimate {
    double noise_std = 0.0;
    double snr_db = kSnrCeilingDb;
};

// noise_std is the RMS residual of each interior sample from the line through its two
// neighbours, scaled by sqrt(2/3) so white noise of deviation s reads as s. The series
// standard deviation is the signal amplitude for snr_db, capped at kSnrCeilingDb.
NoiseEstimate calc_noise(const std::vector<double>& values);

struct HysteresisResult {
    double ratio = 0.0;
    std::vector<double> x;
    std::vector<double> y;
};

// Lag-1 phase portrait (v[i], v[i+1]); signed shoelace area of the closed loop divided by
// max - min. The ratio carries reading units, so thresholds on it depend on signal amplitude.
HysteresisResult calc_hysteresis(const std::vector<double>& values);

struct DfaOptions {
    std::size_t min_scale = 4;
    std::size_t scale_count = 10;
};

struct DfaResult {
    double hurst = kNeutralHurst;
    double r2 = 0.0;
    std::vector<double> scales;
    std::vector<double> fluctuations;
};

// Detrended fluctuation analysis with order-1 local detrending. Only usable scales
// (positive mean fluctuation) are reported. Fewer than two -> hurst 0.5, r2 0.
// hurst is clamped to [0, 1]; the lists keep the raw fluctuation values.
DfaResult calc_dfa(const std::vector<double>& values, const DfaOptions& options = {});

// Logarithmically spaced, floored and de-duplicated window sizes in [min_scale, n / 4].
std::vector<std::size_t> dfa_scales(std::size_t length, const DfaOptions& options = {});

struct DescriptorBundle {
    double bias = 0.0;
    double slope = 0.0;
    double noise_std = 0.0;
    double snr_db = 0.0;
    double hysteresis = 0.0;
    std::vector<double> hysteresis_x;
    std::vector<double> hysteresis_y;
    double hurst = kNeutralHurst;
    double hurst_r2 = 0.0;
    std::vector<double> dfa_scales;
    std::vector<double> dfa_fluctuations;

    std::vector<double> trend;
    std::vector<double> residuals;
    SeriesStatistics statistics{};
};

// Runs every calculator once over the same cleaned values.
DescriptorBundle compute_descriptors(const std::vector<double>& values);

}  // namespace qorsense

#endif  // QORSENSE_DESCRIPTORS_HPP
