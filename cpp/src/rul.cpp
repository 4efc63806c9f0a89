#include "qorsense/rul.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace qorsense {

namespace {

constexpr double kMinute = 60.0;
constexpr double kHour = 3600.0;
constexpr double kDay = 86400.0;
// Beyond this the projection says nothing useful.
constexpr double kMaxProjectedSamples = 1e12;

}  // namespace

std::string describe_duration(double samples, double seconds) {
    std::ostringstream text;
    text << "~" << std::llround(samples) << " samples (~" << std::fixed << std::setprecision(1);
    if (seconds < 2.0 * kMinute) {
        text << seconds << " seconds)";
    } else if (seconds < 2.0 * kHour) {
        text << seconds / kMinute << " minutes)";
    } else if (seconds < 2.0 * kDay) {
        text << seconds / kHour << " hours)";
    } else {
        text << seconds / kDay << " days)";
    }
    return text.str();
}

RulEstimate estimate_rul(const std::vector<double>& values, double slope, const FailureBoundary& boundary,
                         double slope_epsilon, double sample_interval_s) {
    RulEstimate estimate;
    if (values.empty() || !std::isfinite(slope) || std::abs(slope) < slope_epsilon) {
        return estimate;
    }
    const auto& target = slope > 0.0 ? boundary.upper : boundary.lower;
    if (!target.has_value()) {
        return estimate;
    }

    const double last = values.back();
    const double distance = slope > 0.0 ? *target - last : last - *target;
    if (distance <= 0.0) {
        estimate.samples = 0.0;
        estimate.seconds = 0.0;
        estimate.text = "0 samples (failure boundary already crossed)";
        return estimate;
    }

    const double samples = distance / std::abs(slope);
    if (!std::isfinite(samples) || samples > kMaxProjectedSamples) {
        return estimate;
    }
    estimate.samples = samples;
    estimate.seconds = samples * sample_interval_s;
    estimate.text = describe_duration(samples, *estimate.seconds);
    return estimate;
}

RulEstimate estimate_rul(const std::vector<double>& values, double slope, const AnalysisConfig& config) {
    return estimate_rul(values, slope, FailureBoundary{config.failure_upper, config.failure_lower},
                        config.rul_slope_epsilon, config.sample_interval_s);
}

}  // namespace qorsense
