#include "qorsense/tasks.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "qorsense/analyzer.hpp"
#include "qorsense/common.hpp"
#include "qorsense/logging.hpp"

namespace qorsense {

namespace {

AnalysisOutcome failed_outcome(const std::string& sensor_id, const std::string& message, ErrorKind kind) {
    AnalysisOutcome outcome;
    outcome.success = false;
    outcome.sensor_id = sensor_id;
    outcome.error = message;
    outcome.error_kind = kind;
    outcome.completed_at = iso8601_utc(seconds_since_epoch());
    return outcome;
}

std::size_t window_for(const ReadingConfig& reading) {
    const int window = std::min(reading.default_window_size, reading.max_analysis_points);
    return static_cast<std::size_t>(window > 0 ? window : 0);
}

}  // namespace

void AnalysisRequest::validate() const {
    if (sensor_id.empty()) {
        throw InvalidInputError("sensor_id must not be empty");
    }
    if (timestamps && timestamps->size() != values.size()) {
        throw InvalidInputError("timestamps length " + std::to_string(timestamps->size()) +
                                " does not match values length " + std::to_string(values.size()));
    }
}

AnalysisOutcome run_analysis_task(const std::string& sensor_id, const RawSeries& values,
                                  const std::optional<AnalysisConfig>& config) {
    AnalysisRequest request;
    request.sensor_id = sensor_id;
    request.values = values;
    return run_analysis_task(request, config);
}

AnalysisOutcome run_analysis_task(const AnalysisRequest& request, const std::optional<AnalysisConfig>& config) {
    auto logger = get_logger("tasks");
    logger.info("task_started", {{"sensor_id", request.sensor_id},
                                 {"points", std::to_string(request.values.size())}});
    try {
        request.validate();
        SensorAnalyzer analyzer(config.value_or(AnalysisConfig{}));
        const auto result = analyzer.analyze(request.values);

        AnalysisOutcome outcome;
        outcome.success = true;
        outcome.sensor_id = request.sensor_id;
        outcome.record = make_record(request.sensor_id, result);
        outcome.completed_at = outcome.record->timestamp;
        logger.info("task_completed", {{"sensor_id", request.sensor_id},
                                       {"status", status_name(result.health.status)},
                                       {"score", std::to_string(result.health.score)}});
        return outcome;
    } catch (const AnalysisError& exc) {
        logger.error("task_failed", {{"sensor_id", request.sensor_id},
                                     {"kind", error_kind_name(exc.kind())},
                                     {"error", exc.what()}});
        return failed_outcome(request.sensor_id, exc.what(), exc.kind());
    }
}

BatchReport batch_analyze(const std::vector<std::string>& sensor_ids, ReadingStore& readings,
                          ResultStore* results, const BatchOptions& options) {
    auto logger = get_logger("tasks");
    BatchReport report;
    report.total = sensor_ids.size();
    logger.info("batch_started", {{"sensors", std::to_string(report.total)}});

    ReadingQuery query;
    query.max_count = window_for(options.reading);

    for (std::size_t i = 0; i < sensor_ids.size(); ++i) {
        if (options.cancellation && options.cancellation->cancelled()) {
            report.cancelled = true;
            logger.warn("batch_cancelled", {{"processed", std::to_string(report.processed)},
                                            {"total", std::to_string(report.total)}});
            break;
        }
        const auto& sensor_id = sensor_ids[i];
        BatchProgress progress;
        progress.current = i + 1;
        progress.total = report.total;
        progress.sensor_id = sensor_id;
        progress.percent = static_cast<int>(i * 100 / report.total);
        logger.debug("batch_progress", {{"sensor_id", sensor_id},
                                        {"current", std::to_string(progress.current)},
                                        {"percent", std::to_string(progress.percent)}});
        if (options.progress) {
            options.progress(progress);
        }

        AnalysisOutcome outcome;
        try {
            const auto values = readings.fetch(sensor_id, query);
            outcome = run_analysis_task(sensor_id, to_raw_series(values), options.analysis);
            if (outcome.success && results) {
                results->save(*outcome.record);
            }
        } catch (const AnalysisError& exc) {
            outcome = failed_outcome(sensor_id, exc.what(), exc.kind());
        } catch (const std::exception& exc) {
            logger.error("sensor_failed", {{"sensor_id", sensor_id}, {"error", exc.what()}});
            outcome = failed_outcome(sensor_id, exc.what(), ErrorKind::kInternal);
        }
        report.outcomes.push_back(std::move(outcome));
        ++report.processed;
    }

    report.completed_at = iso8601_utc(seconds_since_epoch());
    logger.info("batch_completed", {{"processed", std::to_string(report.processed)},
                                    {"cancelled", report.cancelled ? "true" : "false"}});
    return report;
}

}  // namespace qorsense
