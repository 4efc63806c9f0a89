#include "qorsense/analyzer.hpp"

#include <cmath>
#include <string>
#include <utility>

#include "qorsense/errors.hpp"

namespace qorsense {

namespace {

void require_finite(const char* name, double value) {
    if (!std::isfinite(value)) {
        throw ComputationError(std::string("descriptor '") + name + "' is not finite");
    }
}

void require_finite(const DescriptorBundle& bundle) {
    require_finite("bias", bundle.bias);
    require_finite("slope", bundle.slope);
    require_finite("noise_std", bundle.noise_std);
    require_finite("snr_db", bundle.snr_db);
    require_finite("hysteresis", bundle.hysteresis);
    require_finite("hurst", bundle.hurst);
    require_finite("hurst_r2", bundle.hurst_r2);
    require_finite("std", bundle.statistics.stddev);
}

}  // namespace

SensorAnalyzer::SensorAnalyzer(AnalysisConfig config, Logger logger)
    : config_(std::move(config)), logger_(std::move(logger)) {
    config_.validate();
}

AnalysisResult SensorAnalyzer::analyze(const RawSeries& raw) const {
    return analyze_clean(preprocess(raw));
}

AnalysisResult SensorAnalyzer::analyze(const std::vector<double>& raw) const {
    return analyze_clean(preprocess(raw));
}

AnalysisResult SensorAnalyzer::analyze_clean(const CleanSeries& clean) const {
    AnalysisResult result;
    result.sample_count = clean.size();
    result.dropped_count = clean.dropped;

    if (!has_minimum_points(clean, config_.min_data_points)) {
        logger_.debug("analysis_short_circuit", {{"points", std::to_string(clean.size())},
                                                 {"dropped", std::to_string(clean.dropped)},
                                                 {"min_data_points", std::to_string(config_.min_data_points)}});
        result.health = no_data_assessment();
        return result;
    }

    result.descriptors = compute_descriptors(clean.values);
    require_finite(result.descriptors);
    result.health = score_health(result.descriptors, config_);
    result.rul = estimate_rul(clean.values, result.descriptors.slope, config_);

    if (logger_.enabled(LogLevel::kDebug)) {
        logger_.debug("analysis_completed", {{"points", std::to_string(clean.size())},
                                             {"score", std::to_string(result.health.score)},
                                             {"status", status_name(result.health.status)},
                                             {"rul", result.rul.text}});
    }
    return result;
}

AnalysisResult analyze(const RawSeries& raw, const AnalysisConfig& config) {
    return SensorAnalyzer(config).analyze(raw);
}

AnalysisResult analyze(const std::vector<double>& raw, const AnalysisConfig& config) {
    return SensorAnalyzer(config).analyze(raw);
}

}  // namespace qorsense
