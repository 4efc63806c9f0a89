#include "qorsense/stores.hpp"

#include <algorithm>

namespace qorsense {

void InMemoryReadingStore::append(const std::string& sensor_id, double timestamp, double value) {
    std::lock_guard<std::mutex> guard(mutex_);
    auto& series = readings_[sensor_id];
    Reading reading{timestamp, value};
    auto it = std::upper_bound(series.begin(), series.end(), reading,
                               [](const Reading& lhs, const Reading& rhs) { return lhs.timestamp < rhs.timestamp; });
    series.insert(it, reading);
}

void InMemoryReadingStore::append_series(const std::string& sensor_id, const std::vector<double>& values) {
    std::lock_guard<std::mutex> guard(mutex_);
    auto& series = readings_[sensor_id];
    double next = series.empty() ? 0.0 : series.back().timestamp + 1.0;
    for (double value : values) {
        series.push_back(Reading{next, value});
        next += 1.0;
    }
}

std::vector<double> InMemoryReadingStore::fetch(const std::string& sensor_id, const ReadingQuery& query) {
    std::lock_guard<std::mutex> guard(mutex_);
    std::vector<double> values;
    auto found = readings_.find(sensor_id);
    if (found == readings_.end()) {
        return values;
    }
    for (const auto& reading : found->second) {
        if (query.start_time && reading.timestamp < *query.start_time) {
            continue;
        }
        if (query.end_time && reading.timestamp > *query.end_time) {
            continue;
        }
        values.push_back(reading.value);
    }
    if (query.max_count && values.size() > *query.max_count) {
        values.erase(values.begin(), values.end() - static_cast<std::ptrdiff_t>(*query.max_count));
    }
    return values;
}

std::size_t InMemoryReadingStore::size(const std::string& sensor_id) const {
    std::lock_guard<std::mutex> guard(mutex_);
    auto found = readings_.find(sensor_id);
    return found == readings_.end() ? 0 : found->second.size();
}

void InMemoryResultStore::save(const AnalysisRecord& record) {
    std::lock_guard<std::mutex> guard(mutex_);
    records_.push_back(record);
}

std::vector<AnalysisRecord> InMemoryResultStore::records() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return records_;
}

std::optional<AnalysisRecord> InMemoryResultStore::latest(const std::string& sensor_id) const {
    std::lock_guard<std::mutex> guard(mutex_);
    for (auto it = records_.rbegin(); it != records_.rend(); ++it) {
        if (it->sensor_id == sensor_id) {
            return *it;
        }
    }
    return std::nullopt;
}

}  // namespace qorsense
