#ifndef QORSENSE_STORES_HPP
#define QORSENSE_STORES_HPP

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "qorsense/record.hpp"

namespace qorsense {

struct ReadingQuery {
    std::optional<std::size_t> max_count = std::nullopt;
    std::optional<double> start_time = std::nullopt;
    std::optional<double> end_time = std::nullopt;
};

struct Reading {
    double timestamp = 0.0;
    double value = 0.0;
};

class ReadingStore {
public:
    virtual ~ReadingStore() = default;
    // Chronological values for the sensor; unknown sensors yield an empty list.
    virtual std::vector<double> fetch(const std::string& sensor_id, const ReadingQuery& query) = 0;
};

class ResultStore {
public:
    virtual ~ResultStore() = default;
    virtual void save(const AnalysisRecord& record) = 0;
};

class InMemoryReadingStore : public ReadingStore {
public:
    void append(const std::string& sensor_id, double timestamp, double value);
    // Timestamps 0, 1, 2, ... after the sensor's last reading.
    void append_series(const std::string& sensor_id, const std::vector<double>& values);

    std::vector<double> fetch(const std::string& sensor_id, const ReadingQuery& query) override;
    std::size_t size(const std::string& sensor_id) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<Reading>> readings_;
};

class InMemoryResultStore : public ResultStore {
public:
    void save(const AnalysisRecord& record) override;

    std::vector<AnalysisRecord> records() const;
    std::optional<AnalysisRecord> latest(const std::string& sensor_id) const;

private:
    mutable std::mutex mutex_;
    std::vector<AnalysisRecord> records_;
};

}  // namespace qorsense

#endif  // QORSENSE_STORES_HPP
