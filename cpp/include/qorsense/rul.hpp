#ifndef QORSENSE_RUL_HPP
#define QORSENSE_RUL_HPP

#include <optional>
#include <string>
#include <vector>

#include "qorsense/config.hpp"

namespace qorsense {

constexpr const char* kRulNotAvailable = "N/A";

struct FailureBoundary {
    std::optional<double> upper;
    std::optional<double> lower;
};

struct RulEstimate {
    std::string text = kRulNotAvailable;
    std::optional<double> samples;
    std::optional<double> seconds;

    bool available() const { return samples.has_value(); }
};

// Straight-line projection from the last observed value to the failure boundary in the
// direction of the trend: distance / |slope| samples. It ignores curvature, noise and
// regime changes, so treat the figure as an order of magnitude, not a survival estimate.
RulEstimate estimate_rul(const std::vector<double>& values, double slope, const FailureBoundary& boundary,
                         double slope_epsilon, double sample_interval_s);

RulEstimate estimate_rul(const std::vector<double>& values, double slope, const AnalysisConfig& config);

// "~42 samples (~3.5 minutes)"
std::string describe_duration(double samples, double seconds);

}  // namespace qorsense

#endif  // QORSENSE_RUL_HPP
