#include "qorsense/record.hpp"

#include "qorsense/common.hpp"

namespace qorsense {

AnalysisRecord make_record(const std::string& sensor_id, const AnalysisResult& result) {
    return make_record(sensor_id, result, seconds_since_epoch());
}

AnalysisRecord make_record(const std::string& sensor_id, const AnalysisResult& result, double epoch_seconds) {
    AnalysisRecord record;
    record.sensor_id = sensor_id;
    record.timestamp = iso8601_utc(epoch_seconds);
    record.sample_count = result.sample_count;
    record.dropped_count = result.dropped_count;
    record.descriptors = result.descriptors;
    record.health = result.health;
    record.rul = result.rul.text;
    return record;
}

}  // namespace qorsense
