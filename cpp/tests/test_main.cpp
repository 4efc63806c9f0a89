#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "qorsense/analyzer.hpp"
#include "qorsense/common.hpp"
#include "qorsense/config.hpp"
#include "qorsense/descriptors.hpp"
#include "qorsense/errors.hpp"
#include "qorsense/health.hpp"
#include "qorsense/logging.hpp"
#include "qorsense/preprocess.hpp"
#include "qorsense/rul.hpp"
#include "qorsense/serialization.hpp"
#include "qorsense/statistics.hpp"
#include "qorsense/stores.hpp"
#include "qorsense/synthetic.hpp"
#include "qorsense/tasks.hpp"

namespace {

int failures = 0;

void expect_true(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "FAIL: " << message << "\n";
        failures += 1;
    }
}

void expect_near(double value, double expected, double tolerance, const std::string& message) {
    if (std::fabs(value - expected) > tolerance) {
        std::cerr << "FAIL: " << message << " (got " << value << ", expected " << expected << ")\n";
        failures += 1;
    }
}

template <typename Error, typename Fn>
void expect_throws(Fn&& fn, const std::string& message) {
    try {
        fn();
    } catch (const Error&) {
        return;
    }
    std::cerr << "FAIL: " << message << " (no exception)\n";
    failures += 1;
}

bool has_flag(const qorsense::HealthAssessment& assessment, const std::string& flag) {
    for (const auto& item : assessment.flags) {
        if (item == flag) {
            return true;
        }
    }
    return false;
}

std::filesystem::path temp_path(const std::string& name) {
    return std::filesystem::temp_directory_path() / ("qorsense_test_" + name);
}

std::vector<double> sinusoid(std::size_t length) {
    std::vector<double> values(length);
    for (std::size_t i = 0; i < length; ++i) {
        const double t = 10.0 * static_cast<double>(i) / static_cast<double>(length - 1);
        values[i] = 10.0 * std::sin(t);
    }
    return values;
}

void test_preprocess() {
    qorsense::RawSeries raw = {1.0, std::nullopt, std::numeric_limits<double>::quiet_NaN(), 2.0,
                               std::numeric_limits<double>::infinity(), 3.0};
    auto clean = qorsense::preprocess(raw);
    expect_true(clean.size() == 3, "preprocess keeps finite readings");
    expect_true(clean.dropped == 3, "preprocess counts dropped readings");
    expect_near(clean.values[2], 3.0, 0.0, "preprocess keeps order");

    auto plain = qorsense::preprocess(std::vector<double>{1.0, -std::numeric_limits<double>::infinity(), 4.0});
    expect_true(plain.size() == 2 && plain.dropped == 1, "plain series drops infinities");

    expect_true(!qorsense::has_minimum_points(clean, 1), "absolute minimum of five points");
    expect_true(qorsense::has_minimum_points(qorsense::preprocess(std::vector<double>(5, 1.0)), 1),
                "five points pass a low minimum");
    expect_true(!qorsense::has_minimum_points(qorsense::preprocess(std::vector<double>(20, 1.0)), 50),
                "configured minimum applies");
}

void test_parse_series() {
    auto series = qorsense::parse_series("1, 2,,nan\n3;4 5\r\n");
    expect_true(series.size() == 7, "parse_series token count");
    expect_true(series[2] == std::nullopt && series[3] == std::nullopt, "blank and nan become markers");
    expect_near(series[6].value_or(0.0), 5.0, 0.0, "space separated token");

    auto trailing = qorsense::parse_series("1,2,\n");
    expect_true(trailing.size() == 2, "trailing separators ignored");

    auto markers = qorsense::parse_series("NULL,None,NA,1e999");
    expect_true(qorsense::preprocess(markers).empty(), "missing tokens and overflow become markers");

    expect_throws<qorsense::InvalidInputError>([] { qorsense::parse_series("1,abc,3"); },
                                               "non-numeric token rejected");
    expect_throws<qorsense::InvalidInputError>([] { qorsense::parse_series("1,2x"); },
                                               "partially numeric token rejected");
}

void test_statistics() {
    expect_near(qorsense::percentile({1.0, 2.0, 3.0, 4.0}, 50.0), 2.5, 1e-12, "percentile interpolates");
    expect_near(qorsense::percentile({4.0, 1.0, 3.0, 2.0}, 100.0), 4.0, 1e-12, "percentile max");

    auto stats = qorsense::describe({5.0, 1.0, 3.0, 2.0, 4.0});
    expect_true(stats.count == 5, "describe count");
    expect_near(stats.mean, 3.0, 1e-12, "describe mean");
    expect_near(stats.variance, 2.0, 1e-12, "describe population variance");
    expect_near(stats.median, 3.0, 1e-12, "describe median");
    expect_near(stats.p25, 2.0, 1e-12, "describe p25");
    expect_near(stats.range, 4.0, 1e-12, "describe range");

    auto empty = qorsense::describe({});
    expect_true(empty.count == 0 && empty.mean == 0.0, "describe empty");

    auto fit = qorsense::fit_line({1.0, 3.0, 5.0, 7.0});
    expect_near(fit.slope, 2.0, 1e-12, "fit slope");
    expect_near(fit.intercept, 1.0, 1e-12, "fit intercept");
    expect_near(fit.r2, 1.0, 1e-12, "fit r2");

    auto flat = qorsense::fit_line({2.0, 2.0, 2.0});
    expect_true(flat.slope == 0.0 && flat.r2 == 0.0, "flat fit");

    expect_throws<std::invalid_argument>([] { qorsense::fit_line({1.0, 2.0}, {1.0}); },
                                         "fit_line length mismatch");
}

void test_short_series() {
    for (std::size_t length = 0; length < 5; ++length) {
        auto result = qorsense::analyze(std::vector<double>(length, 1.0));
        const std::string label = "short series length " + std::to_string(length);
        expect_true(result.health.status == qorsense::HealthStatus::kNoData, label + " status");
        expect_near(result.health.score, 0.0, 0.0, label + " score");
        expect_true(result.rul.text == "N/A", label + " rul");
        expect_true(result.descriptors.hysteresis_x.empty() && result.descriptors.dfa_scales.empty() &&
                        result.descriptors.residuals.empty(),
                    label + " empty lists");
    }

    qorsense::AnalysisConfig config;
    config.min_data_points = 50;
    auto below = qorsense::analyze(std::vector<double>(49, 1.0), config);
    expect_true(below.health.status == qorsense::HealthStatus::kNoData, "below min_data_points");
    expect_true(below.health.diagnosis == "Insufficient data for analysis", "no data diagnosis");

    std::vector<double> twenty(20);
    for (std::size_t i = 0; i < twenty.size(); ++i) {
        twenty[i] = 10.0 * std::sin(0.5 * static_cast<double>(i));
    }
    auto analysed = qorsense::analyze(twenty);
    expect_true(analysed.health.status != qorsense::HealthStatus::kNoData, "20 points analysed by default");
    expect_true(analysed.descriptors.hysteresis_x.size() == 19, "20 points give a portrait");

    qorsense::RawSeries gappy(60, std::nullopt);
    auto gaps = qorsense::analyze(gappy);
    expect_true(gaps.health.status == qorsense::HealthStatus::kNoData, "all-invalid series");
    expect_true(gaps.dropped_count == 60, "all-invalid dropped count");
}

void test_constant_series() {
    const std::vector<double> values(100, 3.0);
    auto bundle = qorsense::compute_descriptors(values);
    expect_true(bundle.slope == 0.0, "constant slope");
    expect_true(bundle.hysteresis == 0.0, "constant hysteresis");
    expect_true(bundle.noise_std == 0.0, "constant noise");
    expect_near(bundle.snr_db, qorsense::kSnrCeilingDb, 0.0, "constant snr sentinel");
    expect_near(bundle.hurst, 0.5, 0.0, "constant hurst");
    expect_near(bundle.hurst_r2, 0.0, 0.0, "constant hurst r2");
    expect_near(bundle.bias, 3.0, 1e-12, "constant bias");
    expect_true(bundle.hysteresis_x.size() == 99 && bundle.hysteresis_y.size() == 99, "constant portrait");

    auto result = qorsense::analyze(values);
    expect_true(result.health.status != qorsense::HealthStatus::kNoData, "constant series analyzed");
}

void test_linear_ramp() {
    std::vector<double> ramp(100);
    for (std::size_t i = 0; i < ramp.size(); ++i) {
        ramp[i] = static_cast<double>(i);
    }
    auto bundle = qorsense::compute_descriptors(ramp);
    expect_near(bundle.slope, 1.0, 1e-9, "ramp slope");
    expect_near(bundle.bias, 49.5, 1e-9, "ramp bias");
    expect_near(bundle.noise_std, 0.0, 1e-9, "ramp noise");
    expect_near(bundle.snr_db, qorsense::kSnrCeilingDb, 1e-9, "ramp snr");
    expect_near(qorsense::calc_bias(ramp, 49.5), 0.0, 1e-9, "bias against reference");

    auto result = qorsense::analyze(ramp);
    expect_true(has_flag(result.health, "HIGH_DRIFT"), "ramp drift flagged");
    expect_true(result.rul.text == "N/A", "ramp without boundary");
}

void test_idempotence() {
    auto values = qorsense::generate_signal(qorsense::SignalKind::kNoisy, 300, 7);
    auto first = qorsense::analyze(values);
    auto second = qorsense::analyze(values);
    expect_true(qorsense::to_json(first.descriptors) == qorsense::to_json(second.descriptors),
                "identical descriptors");
    expect_true(qorsense::to_json(first.health) == qorsense::to_json(second.health), "identical health");
    expect_true(first.rul.text == second.rul.text, "identical rul");
}

void test_scenarios() {
    auto normal = qorsense::analyze(qorsense::generate_signal(qorsense::SignalKind::kNormal, 100, 42));
    expect_true(normal.health.status == qorsense::HealthStatus::kNormal, "scenario A normal");
    expect_true(normal.health.score >= 85.0, "scenario A score");

    auto drifting = qorsense::analyze(qorsense::generate_signal(qorsense::SignalKind::kDrifting, 100, 42));
    expect_true(drifting.descriptors.slope > 0.0, "scenario B rising slope");
    expect_true(drifting.health.status == qorsense::HealthStatus::kWarning ||
                    drifting.health.status == qorsense::HealthStatus::kCritical,
                "scenario B at least warning");

    auto noisy = qorsense::analyze(qorsense::generate_signal(qorsense::SignalKind::kNoisy, 100, 42));
    expect_true(noisy.descriptors.snr_db < normal.descriptors.snr_db, "scenario C lower snr");
    expect_true(noisy.health.score < normal.health.score, "scenario C lower score");
    expect_true(has_flag(noisy.health, "EXCESSIVE_NOISE"), "scenario C noise flag");
}

void test_monotonic_noise() {
    const auto base = sinusoid(200);
    // Detrended and centred so bias and slope are the same at every noise level.
    auto noise = qorsense::generate_signal(qorsense::SignalShape{0.0, 1.0, 0.0, 0.0, 10.0, 10.0}, 200, 11);
    const auto fit = qorsense::fit_line(noise);
    for (std::size_t i = 0; i < noise.size(); ++i) {
        noise[i] -= fit.at(static_cast<double>(i));
    }

    qorsense::AnalysisConfig config;
    config.dfa_critical = 1.0;
    config.hysteresis_critical = 1e6;

    double previous_score = 101.0;
    double previous_noise = -1.0;
    for (double level : {0.25, 1.0, 2.0, 4.0}) {
        std::vector<double> values(base.size());
        for (std::size_t i = 0; i < base.size(); ++i) {
            values[i] = base[i] + level * noise[i];
        }
        auto result = qorsense::analyze(values, config);
        const std::string label = "noise level " + std::to_string(level);
        expect_true(result.health.score <= previous_score, label + " score does not rise");
        expect_true(result.descriptors.noise_std > previous_noise, label + " noise estimate grows");
        previous_score = result.health.score;
        previous_noise = result.descriptors.noise_std;
    }
    expect_true(previous_score < 100.0, "heavy noise penalised");
}

void test_noise_estimate() {
    auto white = qorsense::generate_signal(qorsense::SignalShape{0.0, 2.0, 0.0, 0.0, 10.0, 10.0}, 4000, 3);
    auto noise = qorsense::calc_noise(white);
    expect_near(noise.noise_std, 2.0, 0.15, "white noise sigma recovered");
    expect_near(noise.snr_db, 0.0, 1.0, "white noise snr near zero");

    auto short_series = qorsense::calc_noise({1.0, 2.0});
    expect_true(short_series.noise_std == 0.0 && short_series.snr_db == qorsense::kSnrCeilingDb,
                "two points give neutral noise");
}

void test_hysteresis() {
    auto values = qorsense::generate_signal(qorsense::SignalKind::kOscillation, 250, 5);
    auto result = qorsense::calc_hysteresis(values);
    expect_true(result.x.size() == result.y.size(), "portrait coordinates pair up");
    expect_true(result.x.size() == values.size() - 1, "lag-1 portrait length");
    expect_near(result.y.front(), values[1], 0.0, "portrait y is lagged series");

    // Unit square traversed clockwise, then the same square scaled by 3.
    expect_near(qorsense::calc_hysteresis({0.0, 0.0, 1.0, 1.0, 0.0}).ratio, -1.0, 1e-12, "unit square ratio");
    expect_near(qorsense::calc_hysteresis({0.0, 0.0, 3.0, 3.0, 0.0}).ratio, -3.0, 1e-12, "ratio scales with range");
    expect_near(qorsense::calc_hysteresis({0.0, 1.0, 1.0, 1.0, 2.0}).ratio, 0.25, 1e-12, "counter-clockwise is positive");

    auto clean = qorsense::calc_hysteresis(sinusoid(100));
    expect_true(clean.ratio < 0.0 && clean.ratio > -qorsense::AnalysisConfig{}.hysteresis_critical,
                "clean sinusoid below default threshold");

    auto flat = qorsense::calc_hysteresis({1.0, 2.0, 3.0, 2.0, 1.0});
    expect_true(std::isfinite(flat.ratio), "small loop finite");
    expect_true(qorsense::calc_hysteresis({4.0}).x.empty(), "single point has no portrait");
}

void test_dfa() {
    auto white = qorsense::generate_signal(qorsense::SignalShape{0.0, 1.0, 0.0, 0.0, 10.0, 10.0}, 1000, 17);
    auto dfa = qorsense::calc_dfa(white);
    expect_true(dfa.scales.size() == dfa.fluctuations.size(), "dfa list lengths match");
    expect_true(dfa.scales.size() >= 2, "dfa usable scales");
    std::vector<double> log_scales;
    std::vector<double> log_fluctuations;
    for (std::size_t i = 0; i < dfa.scales.size(); ++i) {
        log_scales.push_back(std::log(dfa.scales[i]));
        log_fluctuations.push_back(std::log(dfa.fluctuations[i]));
    }
    auto fit = qorsense::fit_line(log_scales, log_fluctuations);
    expect_near(dfa.hurst, fit.slope, 1e-9, "dfa hurst reproduces regression");
    expect_near(dfa.hurst, 0.5, 0.2, "white noise hurst near one half");
    expect_true(dfa.r2 >= 0.0 && dfa.r2 <= 1.0, "dfa r2 bounded");

    auto scales = qorsense::dfa_scales(1000);
    expect_true(!scales.empty() && scales.front() == 4 && scales.back() == 250, "dfa scale bounds");
    for (std::size_t i = 1; i < scales.size(); ++i) {
        expect_true(scales[i] > scales[i - 1], "dfa scales strictly increasing");
    }

    auto tiny = qorsense::calc_dfa({1.0, 2.0, 1.0, 2.0, 1.0, 2.0, 1.0});
    expect_near(tiny.hurst, 0.5, 0.0, "too few scales neutral hurst");
    expect_near(tiny.r2, 0.0, 0.0, "too few scales neutral r2");
}

void test_health_rules() {
    qorsense::AnalysisConfig config;
    qorsense::DescriptorBundle healthy;
    auto clean = qorsense::score_health(healthy, config);
    expect_near(clean.score, 100.0, 0.0, "healthy score");
    expect_true(clean.flags.empty(), "healthy has no flags");
    expect_true(clean.diagnosis == "Sensor operating within normal parameters", "healthy diagnosis");

    struct Case {
        std::string flag;
        double score;
        void (*apply)(qorsense::DescriptorBundle&);
    };
    const std::vector<Case> cases = {
        {"HIGH_DRIFT", 70.0, [](qorsense::DescriptorBundle& b) { b.slope = 0.2; }},
        {"DRIFT_WARNING", 85.0, [](qorsense::DescriptorBundle& b) { b.slope = -0.07; }},
        {"HIGH_BIAS", 80.0, [](qorsense::DescriptorBundle& b) { b.bias = -3.0; }},
        {"BIAS_WARNING", 95.0, [](qorsense::DescriptorBundle& b) { b.bias = 1.5; }},
        {"EXCESSIVE_NOISE", 75.0, [](qorsense::DescriptorBundle& b) { b.noise_std = 2.0; }},
        {"HYSTERESIS_DETECTED", 85.0, [](qorsense::DescriptorBundle& b) { b.hysteresis = -6.0; }},
        {"PERSISTENT_TREND", 95.0, [](qorsense::DescriptorBundle& b) { b.hurst = 0.9; }},
    };
    for (const auto& item : cases) {
        qorsense::DescriptorBundle bundle;
        item.apply(bundle);
        auto assessment = qorsense::score_health(bundle, config);
        expect_true(assessment.flags.size() == 1 && assessment.flags.front() == item.flag, item.flag + " alone");
        expect_near(assessment.score, item.score, 1e-12, item.flag + " penalty");
    }

    qorsense::DescriptorBundle failing;
    failing.slope = 0.2;
    failing.noise_std = 2.0;
    failing.hysteresis = 6.0;
    auto worst = qorsense::score_health(failing, config);
    expect_near(worst.score, 30.0, 1e-12, "combined penalties");
    expect_true(worst.status == qorsense::HealthStatus::kCritical, "combined status critical");
    expect_true(worst.diagnosis.find("Critical drift") == 0, "dominant rule is first critical");
    expect_true(worst.diagnosis.find("(+2 more findings)") != std::string::npos, "secondary findings counted");

    expect_true(qorsense::status_for_score(85.0) == qorsense::HealthStatus::kNormal, "band 85");
    expect_true(qorsense::status_for_score(84.9) == qorsense::HealthStatus::kWarning, "band below 85");
    expect_true(qorsense::status_for_score(60.0) == qorsense::HealthStatus::kWarning, "band 60");
    expect_true(qorsense::status_for_score(59.9) == qorsense::HealthStatus::kCritical, "band below 60");

    std::vector<qorsense::HealthRule> custom = {
        {"ALWAYS", qorsense::Severity::kWarning, 150.0,
         [](const qorsense::DescriptorBundle&, const qorsense::AnalysisConfig&) { return true; }, "always", "none"},
    };
    auto floored = qorsense::score_health(healthy, config, custom);
    expect_near(floored.score, 0.0, 0.0, "score floored at zero");
}

void test_rul() {
    const std::vector<double> values = {8.0, 9.0, 10.0};
    qorsense::FailureBoundary boundary{20.0, std::nullopt};

    auto projected = qorsense::estimate_rul(values, 0.5, boundary, 1e-6, 1.0);
    expect_true(projected.available(), "rul projected");
    expect_near(projected.samples.value_or(0.0), 20.0, 1e-9, "rul samples");
    expect_true(projected.text == "~20 samples (~20.0 seconds)", "rul text seconds");

    auto minutes = qorsense::estimate_rul(values, 0.01, boundary, 1e-6, 1.0);
    expect_true(minutes.text == "~1000 samples (~16.7 minutes)", "rul text minutes");

    auto crossed = qorsense::estimate_rul(values, 0.5, qorsense::FailureBoundary{5.0, std::nullopt}, 1e-6, 1.0);
    expect_true(crossed.text == "0 samples (failure boundary already crossed)", "rul crossed");
    expect_near(crossed.samples.value_or(-1.0), 0.0, 0.0, "rul crossed samples");

    auto falling = qorsense::estimate_rul(values, -0.5, boundary, 1e-6, 1.0);
    expect_true(falling.text == "N/A" && !falling.available(), "rul without lower boundary");

    auto lower = qorsense::estimate_rul(values, -2.0, qorsense::FailureBoundary{std::nullopt, 0.0}, 1e-6, 1.0);
    expect_near(lower.samples.value_or(0.0), 5.0, 1e-9, "rul falling projection");

    auto flat = qorsense::estimate_rul(values, 1e-9, boundary, 1e-6, 1.0);
    expect_true(flat.text == "N/A", "rul flat trend");

    qorsense::AnalysisConfig config;
    config.failure_upper = 150.0;
    std::vector<double> ramp(100);
    for (std::size_t i = 0; i < ramp.size(); ++i) {
        ramp[i] = static_cast<double>(i);
    }
    auto result = qorsense::analyze(ramp, config);
    expect_near(result.rul.samples.value_or(0.0), 51.0, 1e-6, "analyze projects rul");
}

void test_config() {
    auto config = qorsense::AnalysisConfig::from_fields({{"bias_critical", "3.5"}, {"failure_upper", "80"}});
    expect_near(config.bias_critical, 3.5, 0.0, "from_fields threshold");
    expect_near(config.failure_upper.value_or(0.0), 80.0, 0.0, "from_fields boundary");

    expect_throws<qorsense::ConfigError>(
        [] { qorsense::AnalysisConfig::from_fields({{"bias_critcal", "3.5"}}); }, "unknown field rejected");
    expect_throws<qorsense::ConfigError>(
        [] { qorsense::AnalysisConfig::from_fields({{"bias_warning", "5"}}); }, "warning above critical");
    expect_throws<qorsense::ConfigError>(
        [] { qorsense::AnalysisConfig::from_fields({{"min_data_points", "3"}}); }, "min_data_points floor");
    expect_throws<qorsense::ConfigError>(
        [] { qorsense::AnalysisConfig::from_fields({{"noise_critical", "loud"}}); }, "non-numeric threshold");

    qorsense::AnalysisConfig negative;
    negative.slope_critical = -1.0;
    expect_throws<qorsense::ConfigError>([&] { negative.validate(); }, "negative threshold");
    expect_throws<qorsense::ConfigError>([&] { qorsense::SensorAnalyzer analyzer(negative); },
                                         "analyzer validates config");

    const auto good_path = temp_path("good.toml");
    {
        std::ofstream file(good_path);
        file << "# engine settings\n"
             << "[logging]\nlevel = \"WARN\"\njson = false\n"
             << "[analysis]\nnoise_critical = 2.5\nmin_data_points = 20\n"
             << "[rul]\nfailure_lower = -4.0\nsample_interval_s = 60\n"
             << "[reading]\ndefault_window_size = 500\n";
    }
    auto settings = qorsense::EngineSettings::from_toml(good_path.string());
    expect_true(settings.logging.level == "WARN" && !settings.logging.json, "toml logging section");
    expect_near(settings.analysis.noise_critical, 2.5, 0.0, "toml analysis section");
    expect_true(settings.analysis.min_data_points == 20, "toml integer field");
    expect_near(settings.analysis.failure_lower.value_or(0.0), -4.0, 0.0, "toml rul section");
    expect_near(settings.analysis.sample_interval_s, 60.0, 0.0, "toml sample interval");
    expect_true(settings.reading.default_window_size == 500, "toml reading section");
    std::filesystem::remove(good_path);

    const std::string shipped = std::string(QORSENSE_SOURCE_DIR) + "/config/qorsense.toml";
    auto example = qorsense::EngineSettings::from_toml(shipped);
    expect_true(example.analysis.failure_upper.has_value() && example.analysis.failure_lower.has_value(),
                "example config sets a failure boundary");
    expect_true(example.analysis.min_data_points == qorsense::AnalysisConfig{}.min_data_points,
                "example config matches defaults");
    const auto drifting = qorsense::generate_signal(qorsense::SignalKind::kDrifting, 100, 42);
    auto with_boundary = qorsense::analyze(drifting, example.analysis);
    expect_true(with_boundary.rul.available() && with_boundary.rul.text != "N/A", "example config gives rul");
    expect_true(!qorsense::analyze(drifting).rul.available(), "no boundary gives no rul");

    const auto bad_path = temp_path("bad.toml");
    {
        std::ofstream file(bad_path);
        file << "[analysis]\nnoise_threshold = 2.5\n";
    }
    expect_throws<qorsense::ConfigError>([&] { qorsense::EngineSettings::from_toml(bad_path.string()); },
                                         "toml unknown key rejected");
    std::filesystem::remove(bad_path);

    expect_throws<qorsense::ConfigError>(
        [] { qorsense::EngineSettings::from_toml(temp_path("missing.toml").string()); }, "missing toml file");
}

void test_errors() {
    qorsense::ConfigError config_error("bad");
    expect_true(config_error.kind() == qorsense::ErrorKind::kBadInput, "config errors are bad input");
    qorsense::ComputationError computation_error("nan");
    expect_true(computation_error.kind() == qorsense::ErrorKind::kInternal, "computation errors are internal");
    expect_true(qorsense::error_kind_name(qorsense::ErrorKind::kBadInput) == "bad_input", "error kind name");
}

void test_tasks() {
    auto values = qorsense::to_raw_series(qorsense::generate_signal(qorsense::SignalKind::kNormal, 120, 1));
    auto outcome = qorsense::run_analysis_task("sensor-1", values);
    expect_true(outcome.success && outcome.record.has_value(), "task succeeds");
    expect_true(outcome.record->sensor_id == "sensor-1", "task record sensor");
    expect_true(outcome.record->sample_count == 120, "task record count");
    expect_true(outcome.record->timestamp.size() == 20 && outcome.record->timestamp.back() == 'Z',
                "task record timestamp");

    qorsense::AnalysisRequest request;
    request.sensor_id = "sensor-2";
    request.values = values;
    request.timestamps = std::vector<double>(values.size() - 1, 0.0);
    auto mismatched = qorsense::run_analysis_task(request);
    expect_true(!mismatched.success, "mismatched timestamps fail");
    expect_true(mismatched.error_kind == qorsense::ErrorKind::kBadInput, "mismatched timestamps are bad input");

    qorsense::AnalysisConfig invalid;
    invalid.bias_warning = 9.0;
    auto bad_config = qorsense::run_analysis_task("sensor-3", values, invalid);
    expect_true(!bad_config.success && bad_config.error_kind == qorsense::ErrorKind::kBadInput,
                "invalid config is bad input");

    qorsense::RawSeries overflowing;
    for (int i = 0; i < 60; ++i) {
        overflowing.push_back(i % 2 == 0 ? 1.7e308 : -1.7e308);
    }
    auto internal = qorsense::run_analysis_task("sensor-4", overflowing);
    expect_true(!internal.success && internal.error_kind == qorsense::ErrorKind::kInternal,
                "non-finite descriptors are internal errors");

    std::vector<double> huge(100);
    for (std::size_t i = 0; i < huge.size(); ++i) {
        huge[i] = 1e200 * (1.0 + 0.01 * std::sin(0.3 * static_cast<double>(i)));
    }
    qorsense::AnalysisResult huge_result;
    bool huge_threw = false;
    try {
        huge_result = qorsense::analyze(huge);
    } catch (const qorsense::AnalysisError& exc) {
        huge_threw = true;
        std::cerr << "large readings: " << exc.what() << "\n";
    }
    expect_true(!huge_threw, "large finite readings analysed");
    const auto& big = huge_result.descriptors;
    expect_true(std::isfinite(big.bias) && std::isfinite(big.slope) && std::isfinite(big.noise_std) &&
                    std::isfinite(big.snr_db) && std::isfinite(big.hysteresis) && std::isfinite(big.hurst) &&
                    std::isfinite(big.statistics.stddev),
                "large readings give finite descriptors");
    expect_near(big.bias / 1e200, 1.0, 0.01, "large readings bias");
    auto huge_outcome = qorsense::run_analysis_task("sensor-6", qorsense::to_raw_series(huge));
    expect_true(huge_outcome.success, "large readings task succeeds");

    auto short_outcome = qorsense::run_analysis_task("sensor-5", qorsense::RawSeries{1.0, 2.0});
    expect_true(short_outcome.success, "short input is not a failure");
    expect_true(short_outcome.record->health.status == qorsense::HealthStatus::kNoData, "short input no data");
}

void test_parse_unsigned() {
    expect_true(qorsense::parse_unsigned("200").value_or(0) == 200, "plain integer");
    expect_true(qorsense::parse_unsigned("0").value_or(1) == 0, "zero");
    expect_true(!qorsense::parse_unsigned("-5").has_value(), "negative rejected");
    expect_true(!qorsense::parse_unsigned("+5").has_value(), "sign rejected");
    expect_true(!qorsense::parse_unsigned("").has_value(), "empty rejected");
    expect_true(!qorsense::parse_unsigned("12x").has_value(), "trailing text rejected");
    expect_true(!qorsense::parse_unsigned("99999999999999999999999").has_value(), "overflow rejected");
}

void test_stores() {
    qorsense::InMemoryReadingStore store;
    store.append("temp", 3.0, 30.0);
    store.append("temp", 1.0, 10.0);
    store.append("temp", 2.0, 20.0);
    store.append("temp", 4.0, 40.0);

    auto all = store.fetch("temp", {});
    expect_true(all == std::vector<double>({10.0, 20.0, 30.0, 40.0}), "store returns chronological order");

    qorsense::ReadingQuery recent;
    recent.max_count = 2;
    expect_true(store.fetch("temp", recent) == std::vector<double>({30.0, 40.0}), "max_count keeps most recent");

    qorsense::ReadingQuery window;
    window.start_time = 2.0;
    window.end_time = 3.0;
    expect_true(store.fetch("temp", window) == std::vector<double>({20.0, 30.0}), "time window filter");
    expect_true(store.fetch("unknown", {}).empty(), "unknown sensor empty");

    store.append_series("temp", {50.0, 60.0});
    expect_true(store.size("temp") == 6, "append_series extends");
    expect_near(store.fetch("temp", {}).back(), 60.0, 0.0, "append_series after last reading");

    qorsense::InMemoryResultStore results;
    qorsense::AnalysisRecord first;
    first.sensor_id = "temp";
    first.rul = "first";
    qorsense::AnalysisRecord second = first;
    second.rul = "second";
    results.save(first);
    results.save(second);
    expect_true(results.records().size() == 2, "result store keeps records");
    expect_true(results.latest("temp")->rul == "second", "latest record");
    expect_true(!results.latest("other").has_value(), "no record for other sensor");
}

class FailingReadingStore : public qorsense::ReadingStore {
public:
    std::vector<double> fetch(const std::string& sensor_id, const qorsense::ReadingQuery&) override {
        throw std::runtime_error("store unavailable for " + sensor_id);
    }
};

void test_batch() {
    qorsense::InMemoryReadingStore readings;
    readings.append_series("a", qorsense::generate_signal(qorsense::SignalKind::kNormal, 200, 2));
    readings.append_series("b", {1.0, 2.0, 3.0});
    qorsense::InMemoryResultStore results;

    std::vector<qorsense::BatchProgress> progress;
    qorsense::BatchOptions options;
    options.reading.default_window_size = 150;
    options.progress = [&](const qorsense::BatchProgress& update) { progress.push_back(update); };

    auto report = qorsense::batch_analyze({"a", "b", "c"}, readings, &results, options);
    expect_true(report.total == 3 && report.processed == 3 && !report.cancelled, "batch processes all sensors");
    expect_true(progress.size() == 3, "progress reported per sensor");
    expect_true(progress[0].current == 1 && progress[0].percent == 0, "first progress");
    expect_true(progress[2].current == 3 && progress[2].percent == 66 && progress[2].sensor_id == "c",
                "last progress");
    expect_true(report.outcomes[0].record->sample_count == 150, "batch honours the reading window");
    expect_true(report.outcomes[2].record->health.status == qorsense::HealthStatus::kNoData,
                "unknown sensor is no data");
    expect_true(results.records().size() == 3, "batch saves each record");

    qorsense::CancellationToken token;
    qorsense::BatchOptions cancelling;
    cancelling.cancellation = &token;
    cancelling.progress = [&](const qorsense::BatchProgress&) { token.cancel(); };
    auto cancelled = qorsense::batch_analyze({"a", "b", "c"}, readings, nullptr, cancelling);
    expect_true(cancelled.cancelled, "batch cancelled");
    expect_true(cancelled.processed == 1 && cancelled.outcomes.size() == 1, "in-flight sensor completes");

    FailingReadingStore failing;
    auto failed = qorsense::batch_analyze({"x", "y"}, failing, nullptr);
    expect_true(failed.processed == 2, "batch continues past failures");
    expect_true(!failed.outcomes[0].success && failed.outcomes[0].error.find("store unavailable") == 0,
                "store failure recorded");
    expect_true(failed.outcomes[1].error_kind == qorsense::ErrorKind::kInternal, "store failure is internal");
}

void test_synthetic() {
    auto first = qorsense::generate_signal(qorsense::SignalKind::kNormal, 50, 9);
    auto again = qorsense::generate_signal(qorsense::SignalKind::kNormal, 50, 9);
    auto other = qorsense::generate_signal(qorsense::SignalKind::kNormal, 50, 10);
    expect_true(first == again, "same seed reproduces");
    expect_true(first != other, "different seed differs");

    auto drifting = qorsense::generate_signal(qorsense::SignalKind::kDrifting, 50, 9);
    expect_near(drifting.front() - first.front(), 0.0, 1e-9, "drift starts at zero");
    expect_near(drifting.back() - first.back(), 5.0, 1e-9, "drift ends at five");

    expect_true(qorsense::signal_kind_from_string("Oscillation") == qorsense::SignalKind::kOscillation,
                "signal kind parse");
    expect_throws<qorsense::InvalidInputError>([] { qorsense::signal_kind_from_string("Square"); },
                                               "unknown signal kind");
    expect_true(qorsense::generate_signal(qorsense::SignalKind::kNoisy, 0, 1).empty(), "empty signal");
}

void test_serialization() {
    expect_true(qorsense::json_number(1.5) == "1.5", "json number");
    expect_true(qorsense::json_number(std::numeric_limits<double>::quiet_NaN()) == "null", "json nan");
    expect_true(qorsense::json_number(std::numeric_limits<double>::infinity()) == "null", "json infinity");

    qorsense::DescriptorBundle bundle;
    bundle.bias = std::numeric_limits<double>::quiet_NaN();
    bundle.hysteresis_x = {1.0, 2.0};
    const auto json = qorsense::to_json(bundle);
    expect_true(json.find("{\"bias\":null,\"slope\":0,") == 0, "bundle key order");
    expect_true(json.find("\"hysteresis_x\":[1,2]") != std::string::npos, "bundle arrays");

    auto assessment = qorsense::no_data_assessment();
    assessment.flags = {"A\"B"};
    const auto health_json = qorsense::to_json(assessment);
    expect_true(health_json.find("\"status\":\"No Data\"") != std::string::npos, "health status name");
    expect_true(health_json.find("[\"A\\\"B\"]") != std::string::npos, "health flags escaped");

    qorsense::AnalysisOutcome failed;
    failed.sensor_id = "s";
    failed.error = "bad";
    failed.error_kind = qorsense::ErrorKind::kBadInput;
    const auto outcome_json = qorsense::to_json(failed);
    expect_true(outcome_json.find("\"success\":false") != std::string::npos, "outcome success flag");
    expect_true(outcome_json.find("\"error_kind\":\"bad_input\"") != std::string::npos, "outcome error kind");
    expect_true(outcome_json.find("\"result\"") == std::string::npos, "failed outcome has no result");

    qorsense::BatchReport report;
    report.total = 1;
    report.outcomes.push_back(failed);
    const auto report_json = qorsense::to_json(report);
    expect_true(report_json.find("{\"total\":1,\"processed\":0,\"cancelled\":false,\"outcomes\":[{") == 0,
                "batch report layout");
}

void test_logging() {
    const auto log_path = temp_path("engine.log");
    std::filesystem::remove(log_path);
    qorsense::LoggingConfig config;
    config.level = "INFO";
    config.log_file = log_path.string();
    qorsense::configure_logging(config);

    auto logger = qorsense::get_logger("test");
    logger.debug("hidden");
    logger.info("hello", {{"sensor_id", "line\nbreak"}});

    std::ifstream file(log_path);
    std::stringstream contents;
    contents << file.rdbuf();
    const auto text = contents.str();
    expect_true(text.find("\"message\":\"hello\"") != std::string::npos, "log line written");
    expect_true(text.find("\"sensor_id\":\"line\\nbreak\"") != std::string::npos, "log fields escaped");
    expect_true(text.find("hidden") == std::string::npos, "debug filtered at info");

    const auto rotating_path = temp_path("rotating.log");
    const auto backup = [&](int index) {
        std::filesystem::path path = rotating_path;
        path += "." + std::to_string(index);
        return path;
    };
    for (int index = 0; index <= 3; ++index) {
        std::filesystem::remove(index == 0 ? rotating_path : backup(index));
    }
    qorsense::LoggingConfig rotating;
    rotating.level = "INFO";
    rotating.log_file = rotating_path.string();
    rotating.max_bytes = 200;
    rotating.backup_count = 2;
    qorsense::configure_logging(rotating);
    for (int line = 0; line < 50; ++line) {
        logger.info("rotation", {{"line", std::to_string(line)}});
    }
    expect_true(std::filesystem::exists(rotating_path), "active log kept");
    expect_true(std::filesystem::exists(backup(1)), "first backup created");
    expect_true(std::filesystem::exists(backup(2)), "second backup created");
    expect_true(!std::filesystem::exists(backup(3)), "backup_count respected");

    qorsense::LoggingConfig quiet;
    quiet.level = "ERROR";
    qorsense::configure_logging(quiet);
    for (int index = 0; index <= 3; ++index) {
        std::filesystem::remove(index == 0 ? rotating_path : backup(index));
    }
    expect_true(!logger.enabled(qorsense::LogLevel::kWarn), "level change applies");
    std::filesystem::remove(log_path);
}

}  // namespace

int main() {
    qorsense::LoggingConfig quiet;
    quiet.level = "ERROR";
    qorsense::configure_logging(quiet);

    try {
        test_preprocess();
        test_parse_series();
        test_statistics();
        test_short_series();
        test_constant_series();
        test_linear_ramp();
        test_idempotence();
        test_scenarios();
        test_monotonic_noise();
        test_noise_estimate();
        test_hysteresis();
        test_dfa();
        test_health_rules();
        test_rul();
        test_config();
        test_errors();
        test_tasks();
        test_parse_unsigned();
        test_stores();
        test_batch();
        test_synthetic();
        test_serialization();
        test_logging();
    } catch (const std::exception& exc) {
        std::cerr << "Unhandled exception: " << exc.what() << "\n";
        return 1;
    }

    if (failures > 0) {
        std::cerr << failures << " test(s) failed.\n";
        return 1;
    }

    std::cout << "All tests passed.\n";
    return 0;
}
