#include "qorsense/descriptors.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace qorsense {

namespace {

constexpr double kNoiseFloor = 1e-12;

double window_fluctuation(const std::vector<double>& profile, std::size_t start, std::size_t scale) {
    std::vector<double> segment(profile.begin() + static_cast<std::ptrdiff_t>(start),
                                profile.begin() + static_cast<std::ptrdiff_t>(start + scale));
    const auto fit = fit_line(segment);
    double sum_sq = 0.0;
    for (std::size_t i = 0; i < segment.size(); ++i) {
        const double residual = segment[i] - fit.at(static_cast<double>(i));
        sum_sq += residual * residual;
    }
    return std::sqrt(sum_sq / static_cast<double>(scale));
}

}  // namespace

double calc_bias(const std::vector<double>& values, double reference) {
    if (values.empty()) {
        return 0.0;
    }
    const auto scaled = scale_to_unit(values);
    return scaled.restore(accumulate_stats(scaled.values).mean) - reference;
}

double calc_slope(const std::vector<double>& values) {
    const auto scaled = scale_to_unit(values);
    return scaled.restore(fit_line(scaled.values).slope);
}

NoiseEstimate calc_noise(const std::vector<double>& values) {
    NoiseEstimate estimate;
    const auto scaled = scale_to_unit(values);
    const auto& unit = scaled.values;
    const auto stats = accumulate_stats(unit);
    if (unit.size() < 3 || stats.range() == 0.0) {
        return estimate;
    }

    double sum_sq = 0.0;
    for (std::size_t i = 1; i + 1 < unit.size(); ++i) {
        const double local_line = 0.5 * (unit[i - 1] + unit[i + 1]);
        const double residual = unit[i] - local_line;
        sum_sq += residual * residual;
    }
    const double interior = static_cast<double>(unit.size() - 2);
    const double noise = std::sqrt(sum_sq / interior * (2.0 / 3.0));
    estimate.noise_std = scaled.restore(noise);

    // The ratio is scale free, so it is taken in unit scale.
    const double amplitude = stats.stddev();
    if (noise <= kNoiseFloor * amplitude) {
        estimate.snr_db = kSnrCeilingDb;
        return estimate;
    }
    estimate.snr_db = std::min(kSnrCeilingDb, 20.0 * std::log10(amplitude / noise));
    return estimate;
}

HysteresisResult calc_hysteresis(const std::vector<double>& values) {
    HysteresisResult result;
    if (values.size() < 2) {
        return result;
    }
    result.x.assign(values.begin(), values.end() - 1);
    result.y.assign(values.begin() + 1, values.end());

    const auto scaled = scale_to_unit(values);
    const auto stats = accumulate_stats(scaled.values);
    const double span = stats.range();
    if (span == 0.0) {
        return result;
    }

    // Centred coordinates keep the cross products small; the area is translation invariant.
    const double centre = stats.mean;
    const auto& unit = scaled.values;
    const std::size_t points = unit.size() - 1;
    double twice_area = 0.0;
    for (std::size_t i = 0; i < points; ++i) {
        const std::size_t next = (i + 1) % points;
        twice_area += (unit[i] - centre) * (unit[next + 1] - centre) -
                      (unit[next] - centre) * (unit[i + 1] - centre);
    }
    result.ratio = scaled.restore(0.5 * twice_area / span);
    return result;
}

std::vector<std::size_t> dfa_scales(std::size_t length, const DfaOptions& options) {
    std::vector<std::size_t> scales;
    const std::size_t min_scale = std::max<std::size_t>(options.min_scale, 2);
    const std::size_t max_scale = length / 4;
    if (max_scale < min_scale || options.scale_count == 0) {
        return scales;
    }
    if (max_scale == min_scale || options.scale_count == 1) {
        scales.push_back(min_scale);
        return scales;
    }

    const double log_min = std::log(static_cast<double>(min_scale));
    const double log_max = std::log(static_cast<double>(max_scale));
    const double steps = static_cast<double>(options.scale_count - 1);
    for (std::size_t k = 0; k < options.scale_count; ++k) {
        const double exponent = log_min + (log_max - log_min) * static_cast<double>(k) / steps;
        auto scale = static_cast<std::size_t>(std::floor(std::exp(exponent) + 1e-9));
        scale = std::clamp(scale, min_scale, max_scale);
        if (scales.empty() || scales.back() != scale) {
            scales.push_back(scale);
        }
    }
    return scales;
}

DfaResult calc_dfa(const std::vector<double>& values, const DfaOptions& options) {
    DfaResult result;
    const auto scaled = scale_to_unit(values);
    const auto stats = accumulate_stats(scaled.values);
    if (stats.range() == 0.0) {
        return result;
    }
    const auto scales = dfa_scales(values.size(), options);
    if (scales.size() < 2) {
        return result;
    }

    std::vector<double> profile(values.size());
    double running = 0.0;
    for (std::size_t i = 0; i < values.size(); ++i) {
        running += scaled.values[i] - stats.mean;
        profile[i] = running;
    }

    std::vector<double> log_scales;
    std::vector<double> log_fluctuations;
    for (std::size_t scale : scales) {
        const std::size_t windows = profile.size() / scale;
        if (windows == 0) {
            continue;
        }
        double total = 0.0;
        for (std::size_t w = 0; w < windows; ++w) {
            total += window_fluctuation(profile, w * scale, scale);
        }
        const double fluctuation = total / static_cast<double>(windows);
        if (!(fluctuation > 0.0) || !std::isfinite(fluctuation)) {
            continue;
        }
        result.scales.push_back(static_cast<double>(scale));
        result.fluctuations.push_back(scaled.restore(fluctuation));
        log_scales.push_back(std::log(static_cast<double>(scale)));
        log_fluctuations.push_back(std::log(fluctuation));
    }

    if (log_scales.size() < 2) {
        result.hurst = kNeutralHurst;
        result.r2 = 0.0;
        return result;
    }
    const auto fit = fit_line(log_scales, log_fluctuations);
    result.hurst = std::clamp(fit.slope, 0.0, 1.0);
    result.r2 = std::clamp(fit.r2, 0.0, 1.0);
    return result;
}

DescriptorBundle compute_descriptors(const std::vector<double>& values) {
    DescriptorBundle bundle;
    const auto scaled = scale_to_unit(values);
    const auto fit = fit_line(scaled.values);
    bundle.bias = calc_bias(values);
    bundle.slope = calc_slope(values);

    const auto noise = calc_noise(values);
    bundle.noise_std = noise.noise_std;
    bundle.snr_db = noise.snr_db;

    auto hysteresis = calc_hysteresis(values);
    bundle.hysteresis = hysteresis.ratio;
    bundle.hysteresis_x = std::move(hysteresis.x);
    bundle.hysteresis_y = std::move(hysteresis.y);

    auto dfa = calc_dfa(values);
    bundle.hurst = dfa.hurst;
    bundle.hurst_r2 = dfa.r2;
    bundle.dfa_scales = std::move(dfa.scales);
    bundle.dfa_fluctuations = std::move(dfa.fluctuations);

    bundle.trend.reserve(values.size());
    bundle.residuals.reserve(values.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
        const double fitted = scaled.restore(fit.at(static_cast<double>(i)));
        bundle.trend.push_back(fitted);
        bundle.residuals.push_back(values[i] - fitted);
    }
    bundle.statistics = describe(values);
    return bundle;
}

}  // namespace qorsense
