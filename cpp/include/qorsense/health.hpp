#ifndef QORSENSE_HEALTH_HPP
#define QORSENSE_HEALTH_HPP

#include <functional>
#include <string>
#include <vector>

#include "qorsense/config.hpp"
#include "qorsense/descriptors.hpp"

namespace qorsense {

enum class HealthStatus {
    kNormal,
    kWarning,
    kCritical,
    kNoData,
};

std::string status_name(HealthStatus status);

enum class Severity {
    kWarning = 1,
    kCritical = 2,
};

struct HealthAssessment {
    double score = 0.0;
    HealthStatus status = HealthStatus::kNoData;
    std::string diagnosis;
    std::vector<std::string> flags;
    std::string recommendation;
};

using HealthPredicate = std::function<bool(const DescriptorBundle&, const AnalysisConfig&)>;

// One threshold check. Rules are evaluated in list order; each rule that fires deducts
// its penalty and contributes its flag.
struct HealthRule {
    std::string flag;
    Severity severity = Severity::kWarning;
    double penalty = 0.0;
    HealthPredicate predicate;
    std::string diagnosis;
    std::string recommendation;
};

constexpr double kNormalScoreFloor = 85.0;
constexpr double kWarningScoreFloor = 60.0;

const std::vector<HealthRule>& default_health_rules();

HealthStatus status_for_score(double score);

HealthAssessment score_health(const DescriptorBundle& bundle, const AnalysisConfig& config);
HealthAssessment score_health(const DescriptorBundle& bundle, const AnalysisConfig& config,
                              const std::vector<HealthRule>& rules);

HealthAssessment no_data_assessment();

}  // namespace qorsense

#endif  // QORSENSE_HEALTH_HPP
