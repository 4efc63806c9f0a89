#ifndef QORSENSE_ANALYZER_HPP
#define QORSENSE_ANALYZER_HPP

#include <cstddef>
#include <vector>

#include "qorsense/config.hpp"
#include "qorsense/descriptors.hpp"
#include "qorsense/health.hpp"
#include "qorsense/logging.hpp"
#include "qorsense/preprocess.hpp"
#include "qorsense/rul.hpp"

namespace qorsense {

struct AnalysisResult {
    DescriptorBundle descriptors{};
    HealthAssessment health{};
    RulEstimate rul{};
    std::size_t sample_count = 0;
    std::size_t dropped_count = 0;
};

// Stateless apart from its read-only config; one instance may serve any number of
// threads. The individual calculators are the free functions in descriptors.hpp,
// health.hpp and rul.hpp; analyze() composes exactly those.
class SensorAnalyzer {
public:
    explicit SensorAnalyzer(AnalysisConfig config = {}, Logger logger = get_logger("SensorAnalyzer"));

    const AnalysisConfig& config() const { return config_; }

    AnalysisResult analyze(const RawSeries& raw) const;
    AnalysisResult analyze(const std::vector<double>& raw) const;

private:
    AnalysisResult analyze_clean(const CleanSeries& clean) const;

    AnalysisConfig config_;
    Logger logger_;
};

AnalysisResult analyze(const RawSeries& raw, const AnalysisConfig& config = {});
AnalysisResult analyze(const std::vector<double>& raw, const AnalysisConfig& config = {});

}  // namespace qorsense

#endif  // QORSENSE_ANALYZER_HPP
