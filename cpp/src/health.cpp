#include "qorsense/health.hpp"

#include <algorithm>
#include <cmath>

namespace qorsense {

namespace {

constexpr const char* kHealthyDiagnosis = "Sensor operating within normal parameters";
constexpr const char* kHealthyRecommendation = "Continue routine monitoring";

std::vector<HealthRule> build_default_rules() {
    std::vector<HealthRule> rules;
    rules.push_back(HealthRule{
        "HIGH_DRIFT", Severity::kCritical, 30.0,
        [](const DescriptorBundle& b, const AnalysisConfig& c) { return std::abs(b.slope) > c.slope_critical; },
        "Critical drift: the reading trend exceeds the allowed rate of change",
        "Recalibrate the sensor immediately and inspect for degradation"});
    rules.push_back(HealthRule{
        "DRIFT_WARNING", Severity::kWarning, 15.0,
        [](const DescriptorBundle& b, const AnalysisConfig& c) {
            const double magnitude = std::abs(b.slope);
            return magnitude > c.slope_warning && magnitude <= c.slope_critical;
        },
        "Moderate drift detected in the reading trend",
        "Schedule a calibration check"});
    rules.push_back(HealthRule{
        "HIGH_BIAS", Severity::kCritical, 20.0,
        [](const DescriptorBundle& b, const AnalysisConfig& c) { return std::abs(b.bias) > c.bias_critical; },
        "Large steady-state offset from the reference level",
        "Apply a zero/offset calibration and verify the reference"});
    rules.push_back(HealthRule{
        "BIAS_WARNING", Severity::kWarning, 5.0,
        [](const DescriptorBundle& b, const AnalysisConfig& c) {
            const double magnitude = std::abs(b.bias);
            return magnitude > c.bias_warning && magnitude <= c.bias_critical;
        },
        "Noticeable offset from the reference level",
        "Verify the offset during the next maintenance window"});
    rules.push_back(HealthRule{
        "EXCESSIVE_NOISE", Severity::kCritical, 25.0,
        [](const DescriptorBundle& b, const AnalysisConfig& c) { return b.noise_std > c.noise_critical; },
        "Excessive signal noise degrades measurement reliability",
        "Check wiring, shielding and grounding; replace the sensor if noise persists"});
    rules.push_back(HealthRule{
        "HYSTERESIS_DETECTED", Severity::kWarning, 15.0,
        [](const DescriptorBundle& b, const AnalysisConfig& c) {
            return std::abs(b.hysteresis) > c.hysteresis_critical;
        },
        "Hysteresis: rising and falling excursions follow different paths",
        "Inspect for mechanical wear, fouling or sticking components"});
    rules.push_back(HealthRule{
        "PERSISTENT_TREND", Severity::kWarning, 5.0,
        [](const DescriptorBundle& b, const AnalysisConfig& c) { return b.hurst > c.dfa_critical; },
        "Persistent long-range correlation suggests a developing trend",
        "Increase monitoring frequency and watch for drift"});
    return rules;
}

}  // namespace

std::string status_name(HealthStatus status) {
    switch (status) {
        case HealthStatus::kNormal:
            return "Normal";
        case HealthStatus::kWarning:
            return "Warning";
        case HealthStatus::kCritical:
            return "Critical";
        case HealthStatus::kNoData:
            return "No Data";
    }
    return "No Data";
}

const std::vector<HealthRule>& default_health_rules() {
    static const std::vector<HealthRule> rules = build_default_rules();
    return rules;
}

HealthStatus status_for_score(double score) {
    if (score >= kNormalScoreFloor) {
        return HealthStatus::kNormal;
    }
    if (score >= kWarningScoreFloor) {
        return HealthStatus::kWarning;
    }
    return HealthStatus::kCritical;
}

HealthAssessment score_health(const DescriptorBundle& bundle, const AnalysisConfig& config) {
    return score_health(bundle, config, default_health_rules());
}

HealthAssessment score_health(const DescriptorBundle& bundle, const AnalysisConfig& config,
                              const std::vector<HealthRule>& rules) {
    HealthAssessment assessment;
    double score = 100.0;
    const HealthRule* dominant = nullptr;

    for (const auto& rule : rules) {
        if (!rule.predicate || !rule.predicate(bundle, config)) {
            continue;
        }
        score -= rule.penalty;
        assessment.flags.push_back(rule.flag);
        // Ties keep the earlier rule, so list order ranks causes of equal severity.
        if (dominant == nullptr || static_cast<int>(rule.severity) > static_cast<int>(dominant->severity)) {
            dominant = &rule;
        }
    }

    assessment.score = std::clamp(score, 0.0, 100.0);
    assessment.status = status_for_score(assessment.score);
    if (dominant == nullptr) {
        assessment.diagnosis = kHealthyDiagnosis;
        assessment.recommendation = kHealthyRecommendation;
    } else {
        assessment.diagnosis = dominant->diagnosis;
        assessment.recommendation = dominant->recommendation;
        if (assessment.flags.size() > 1) {
            assessment.diagnosis += " (+" + std::to_string(assessment.flags.size() - 1) + " more finding";
            assessment.diagnosis += assessment.flags.size() > 2 ? "s)" : ")";
        }
    }
    return assessment;
}

HealthAssessment no_data_assessment() {
    HealthAssessment assessment;
    assessment.score = 0.0;
    assessment.status = HealthStatus::kNoData;
    assessment.diagnosis = "Insufficient data for analysis";
    assessment.recommendation = "Ingest more data points";
    return assessment;
}

}  // namespace qorsense
