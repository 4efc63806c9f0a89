#ifndef QORSENSE_RECORD_HPP
#define QORSENSE_RECORD_HPP

#include <cstddef>
#include <string>

#include "qorsense/analyzer.hpp"

namespace qorsense {

// A persisted analysis. The timestamp is stamped when the record is built, outside the
// computation, so two analyses of the same input differ only here.
struct AnalysisRecord {
    std::string sensor_id;
    std::string timestamp;
    std::size_t sample_count = 0;
    std::size_t dropped_count = 0;
    DescriptorBundle descriptors{};
    HealthAssessment health{};
    std::string rul = kRulNotAvailable;
};

AnalysisRecord make_record(const std::string& sensor_id, const AnalysisResult& result);
AnalysisRecord make_record(const std::string& sensor_id, const AnalysisResult& result, double epoch_seconds);

}  // namespace qorsense

#endif  // QORSENSE_RECORD_HPP
