#ifndef QORSENSE_TASKS_HPP
#define QORSENSE_TASKS_HPP

#include <atomic>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "qorsense/config.hpp"
#include "qorsense/errors.hpp"
#include "qorsense/preprocess.hpp"
#include "qorsense/record.hpp"
#include "qorsense/stores.hpp"

namespace qorsense {

struct AnalysisRequest {
    std::string sensor_id;
    RawSeries values;
    std::optional<std::vector<double>> timestamps = std::nullopt;

    // Throws InvalidInputError when timestamps do not pair up with values.
    void validate() const;
};

struct AnalysisOutcome {
    bool success = false;
    std::string sensor_id;
    std::optional<AnalysisRecord> record = std::nullopt;
    std::string error;
    std::optional<ErrorKind> error_kind = std::nullopt;
    std::string completed_at;
};

class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

struct BatchProgress {
    std::size_t current = 0;
    std::size_t total = 0;
    std::string sensor_id;
    int percent = 0;
};

using ProgressCallback = std::function<void(const BatchProgress&)>;

struct BatchReport {
    std::size_t total = 0;
    std::size_t processed = 0;
    bool cancelled = false;
    std::vector<AnalysisOutcome> outcomes;
    std::string completed_at;
};

// Dispatcher entry point. Bad input and computation failures come back as an
// unsuccessful outcome carrying the error kind; nothing derived from AnalysisError escapes.
AnalysisOutcome run_analysis_task(const std::string& sensor_id, const RawSeries& values,
                                  const std::optional<AnalysisConfig>& config = std::nullopt);
AnalysisOutcome run_analysis_task(const AnalysisRequest& request,
                                  const std::optional<AnalysisConfig>& config = std::nullopt);

struct BatchOptions {
    AnalysisConfig analysis{};
    ReadingConfig reading{};
    ProgressCallback progress = nullptr;
    const CancellationToken* cancellation = nullptr;
};

// Sensors are processed in order. Cancellation is honoured between sensors only; a
// sensor already in progress always completes.
BatchReport batch_analyze(const std::vector<std::string>& sensor_ids, ReadingStore& readings,
                          ResultStore* results, const BatchOptions& options = {});

}  // namespace qorsense

#endif  // QORSENSE_TASKS_HPP
