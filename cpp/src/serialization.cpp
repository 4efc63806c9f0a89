#include "qorsense/serialization.hpp"

#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <vector>

#include "qorsense/logging.hpp"

namespace qorsense {

namespace {

class ObjectWriter {
public:
    ObjectWriter() { out_ << '{'; }

    ObjectWriter& raw(const std::string& key, const std::string& json) {
        separator();
        out_ << '"' << json_escape(key) << "\":" << json;
        return *this;
    }

    ObjectWriter& string(const std::string& key, const std::string& value) {
        return raw(key, "\"" + json_escape(value) + "\"");
    }

    ObjectWriter& number(const std::string& key, double value) { return raw(key, json_number(value)); }

    ObjectWriter& integer(const std::string& key, std::size_t value) { return raw(key, std::to_string(value)); }

    ObjectWriter& boolean(const std::string& key, bool value) { return raw(key, value ? "true" : "false"); }

    std::string str() {
        out_ << '}';
        return out_.str();
    }

private:
    void separator() {
        if (!first_) {
            out_ << ',';
        }
        first_ = false;
    }

    std::ostringstream out_;
    bool first_ = true;
};

std::string number_array(const std::vector<double>& values) {
    std::string json = "[";
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            json += ',';
        }
        json += json_number(values[i]);
    }
    json += ']';
    return json;
}

std::string string_array(const std::vector<std::string>& values) {
    std::string json = "[";
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            json += ',';
        }
        json += "\"" + json_escape(values[i]) + "\"";
    }
    json += ']';
    return json;
}

}  // namespace

std::string json_number(double value) {
    if (!std::isfinite(value)) {
        return "null";
    }
    std::ostringstream out;
    out << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
    return out.str();
}

std::string to_json(const SeriesStatistics& statistics) {
    return ObjectWriter()
        .integer("count", statistics.count)
        .number("mean", statistics.mean)
        .number("std", statistics.stddev)
        .number("variance", statistics.variance)
        .number("min", statistics.min)
        .number("max", statistics.max)
        .number("median", statistics.median)
        .number("range", statistics.range)
        .number("p25", statistics.p25)
        .number("p50", statistics.p50)
        .number("p75", statistics.p75)
        .number("p90", statistics.p90)
        .number("p95", statistics.p95)
        .number("p99", statistics.p99)
        .str();
}

std::string to_json(const DescriptorBundle& bundle) {
    return ObjectWriter()
        .number("bias", bundle.bias)
        .number("slope", bundle.slope)
        .number("noise_std", bundle.noise_std)
        .number("snr_db", bundle.snr_db)
        .number("hysteresis", bundle.hysteresis)
        .raw("hysteresis_x", number_array(bundle.hysteresis_x))
        .raw("hysteresis_y", number_array(bundle.hysteresis_y))
        .number("hurst", bundle.hurst)
        .number("hurst_r2", bundle.hurst_r2)
        .raw("dfa_scales", number_array(bundle.dfa_scales))
        .raw("dfa_fluctuations", number_array(bundle.dfa_fluctuations))
        .raw("trend", number_array(bundle.trend))
        .raw("residuals", number_array(bundle.residuals))
        .raw("statistics", to_json(bundle.statistics))
        .str();
}

std::string to_json(const HealthAssessment& assessment) {
    return ObjectWriter()
        .number("score", assessment.score)
        .string("status", status_name(assessment.status))
        .string("diagnosis", assessment.diagnosis)
        .raw("flags", string_array(assessment.flags))
        .string("recommendation", assessment.recommendation)
        .str();
}

std::string to_json(const AnalysisRecord& record) {
    return ObjectWriter()
        .string("sensor_id", record.sensor_id)
        .string("timestamp", record.timestamp)
        .integer("sample_count", record.sample_count)
        .integer("dropped_count", record.dropped_count)
        .raw("metrics", to_json(record.descriptors))
        .raw("health", to_json(record.health))
        .string("rul", record.rul)
        .str();
}

std::string to_json(const AnalysisOutcome& outcome) {
    ObjectWriter writer;
    writer.boolean("success", outcome.success).string("sensor_id", outcome.sensor_id);
    if (outcome.record) {
        writer.raw("result", to_json(*outcome.record));
    }
    if (outcome.error_kind) {
        writer.string("error", outcome.error).string("error_kind", error_kind_name(*outcome.error_kind));
    }
    writer.string("completed_at", outcome.completed_at);
    return writer.str();
}

std::string to_json(const BatchReport& report) {
    std::string outcomes = "[";
    for (std::size_t i = 0; i < report.outcomes.size(); ++i) {
        if (i > 0) {
            outcomes += ',';
        }
        outcomes += to_json(report.outcomes[i]);
    }
    outcomes += ']';
    return ObjectWriter()
        .integer("total", report.total)
        .integer("processed", report.processed)
        .boolean("cancelled", report.cancelled)
        .raw("outcomes", outcomes)
        .string("completed_at", report.completed_at)
        .str();
}

}  // namespace qorsense
