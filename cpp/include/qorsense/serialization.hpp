#ifndef QORSENSE_SERIALIZATION_HPP
#define QORSENSE_SERIALIZATION_HPP

#include <string>

#include "qorsense/descriptors.hpp"
#include "qorsense/health.hpp"
#include "qorsense/record.hpp"
#include "qorsense/statistics.hpp"
#include "qorsense/tasks.hpp"

namespace qorsense {

// Compact JSON, keys in a fixed order. NaN and infinities are written as null.
std::string to_json(const SeriesStatistics& statistics);
std::string to_json(const DescriptorBundle& bundle);
std::string to_json(const HealthAssessment& assessment);
std::string to_json(const AnalysisRecord& record);
std::string to_json(const AnalysisOutcome& outcome);
std::string to_json(const BatchReport& report);

std::string json_number(double value);

}  // namespace qorsense

#endif  // QORSENSE_SERIALIZATION_HPP
