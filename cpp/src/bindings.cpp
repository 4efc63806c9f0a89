#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "qorsense/analyzer.hpp"
#include "qorsense/config.hpp"
#include "qorsense/descriptors.hpp"
#include "qorsense/errors.hpp"
#include "qorsense/health.hpp"
#include "qorsense/rul.hpp"
#include "qorsense/serialization.hpp"
#include "qorsense/synthetic.hpp"
#include "qorsense/tasks.hpp"

namespace py = pybind11;

PYBIND11_MODULE(qorsense_python, m) {
    m.doc() = "Pybind11 bindings for the QorSense sensor analysis core.";

    auto analysis_error = py::register_exception<qorsense::AnalysisError>(m, "AnalysisError", PyExc_ValueError);
    py::register_exception<qorsense::InvalidInputError>(m, "InvalidInputError", analysis_error.ptr());
    py::register_exception<qorsense::ComputationError>(m, "ComputationError", analysis_error.ptr());

    py::enum_<qorsense::ErrorKind>(m, "ErrorKind")
        .value("BAD_INPUT", qorsense::ErrorKind::kBadInput)
        .value("INTERNAL", qorsense::ErrorKind::kInternal);

    py::enum_<qorsense::HealthStatus>(m, "HealthStatus")
        .value("NORMAL", qorsense::HealthStatus::kNormal)
        .value("WARNING", qorsense::HealthStatus::kWarning)
        .value("CRITICAL", qorsense::HealthStatus::kCritical)
        .value("NO_DATA", qorsense::HealthStatus::kNoData);

    py::enum_<qorsense::SignalKind>(m, "SignalKind")
        .value("NORMAL", qorsense::SignalKind::kNormal)
        .value("DRIFTING", qorsense::SignalKind::kDrifting)
        .value("NOISY", qorsense::SignalKind::kNoisy)
        .value("OSCILLATION", qorsense::SignalKind::kOscillation);

    py::class_<qorsense::AnalysisConfig>(m, "AnalysisConfig")
        .def(py::init<>())
        .def_readwrite("slope_critical", &qorsense::AnalysisConfig::slope_critical)
        .def_readwrite("slope_warning", &qorsense::AnalysisConfig::slope_warning)
        .def_readwrite("bias_critical", &qorsense::AnalysisConfig::bias_critical)
        .def_readwrite("bias_warning", &qorsense::AnalysisConfig::bias_warning)
        .def_readwrite("noise_critical", &qorsense::AnalysisConfig::noise_critical)
        .def_readwrite("hysteresis_critical", &qorsense::AnalysisConfig::hysteresis_critical)
        .def_readwrite("dfa_critical", &qorsense::AnalysisConfig::dfa_critical)
        .def_readwrite("min_data_points", &qorsense::AnalysisConfig::min_data_points)
        .def_readwrite("failure_upper", &qorsense::AnalysisConfig::failure_upper)
        .def_readwrite("failure_lower", &qorsense::AnalysisConfig::failure_lower)
        .def_readwrite("sample_interval_s", &qorsense::AnalysisConfig::sample_interval_s)
        .def_readwrite("rul_slope_epsilon", &qorsense::AnalysisConfig::rul_slope_epsilon)
        .def("validate", &qorsense::AnalysisConfig::validate)
        .def_static("from_fields", &qorsense::AnalysisConfig::from_fields);

    py::class_<qorsense::NoiseEstimate>(m, "NoiseEstimate")
        .def_readonly("noise_std", &qorsense::NoiseEstimate::noise_std)
        .def_readonly("snr_db", &qorsense::NoiseEstimate::snr_db);

    py::class_<qorsense::HysteresisResult>(m, "HysteresisResult")
        .def_readonly("ratio", &qorsense::HysteresisResult::ratio)
        .def_readonly("x", &qorsense::HysteresisResult::x)
        .def_readonly("y", &qorsense::HysteresisResult::y);

    py::class_<qorsense::DfaResult>(m, "DfaResult")
        .def_readonly("hurst", &qorsense::DfaResult::hurst)
        .def_readonly("r2", &qorsense::DfaResult::r2)
        .def_readonly("scales", &qorsense::DfaResult::scales)
        .def_readonly("fluctuations", &qorsense::DfaResult::fluctuations);

    py::class_<qorsense::DescriptorBundle>(m, "DescriptorBundle")
        .def_readonly("bias", &qorsense::DescriptorBundle::bias)
        .def_readonly("slope", &qorsense::DescriptorBundle::slope)
        .def_readonly("noise_std", &qorsense::DescriptorBundle::noise_std)
        .def_readonly("snr_db", &qorsense::DescriptorBundle::snr_db)
        .def_readonly("hysteresis", &qorsense::DescriptorBundle::hysteresis)
        .def_readonly("hysteresis_x", &qorsense::DescriptorBundle::hysteresis_x)
        .def_readonly("hysteresis_y", &qorsense::DescriptorBundle::hysteresis_y)
        .def_readonly("hurst", &qorsense::DescriptorBundle::hurst)
        .def_readonly("hurst_r2", &qorsense::DescriptorBundle::hurst_r2)
        .def_readonly("dfa_scales", &qorsense::DescriptorBundle::dfa_scales)
        .def_readonly("dfa_fluctuations", &qorsense::DescriptorBundle::dfa_fluctuations)
        .def_readonly("trend", &qorsense::DescriptorBundle::trend)
        .def_readonly("residuals", &qorsense::DescriptorBundle::residuals);

    py::class_<qorsense::HealthAssessment>(m, "HealthAssessment")
        .def_readonly("score", &qorsense::HealthAssessment::score)
        .def_readonly("status", &qorsense::HealthAssessment::status)
        .def_readonly("diagnosis", &qorsense::HealthAssessment::diagnosis)
        .def_readonly("flags", &qorsense::HealthAssessment::flags)
        .def_readonly("recommendation", &qorsense::HealthAssessment::recommendation);

    py::class_<qorsense::RulEstimate>(m, "RulEstimate")
        .def_readonly("text", &qorsense::RulEstimate::text)
        .def_readonly("samples", &qorsense::RulEstimate::samples)
        .def_readonly("seconds", &qorsense::RulEstimate::seconds);

    py::class_<qorsense::AnalysisResult>(m, "AnalysisResult")
        .def_readonly("descriptors", &qorsense::AnalysisResult::descriptors)
        .def_readonly("health", &qorsense::AnalysisResult::health)
        .def_readonly("rul", &qorsense::AnalysisResult::rul)
        .def_readonly("sample_count", &qorsense::AnalysisResult::sample_count)
        .def_readonly("dropped_count", &qorsense::AnalysisResult::dropped_count);

    py::class_<qorsense::AnalysisRecord>(m, "AnalysisRecord")
        .def_readonly("sensor_id", &qorsense::AnalysisRecord::sensor_id)
        .def_readonly("timestamp", &qorsense::AnalysisRecord::timestamp)
        .def_readonly("descriptors", &qorsense::AnalysisRecord::descriptors)
        .def_readonly("health", &qorsense::AnalysisRecord::health)
        .def_readonly("rul", &qorsense::AnalysisRecord::rul);

    py::class_<qorsense::AnalysisOutcome>(m, "AnalysisOutcome")
        .def_readonly("success", &qorsense::AnalysisOutcome::success)
        .def_readonly("sensor_id", &qorsense::AnalysisOutcome::sensor_id)
        .def_readonly("record", &qorsense::AnalysisOutcome::record)
        .def_readonly("error", &qorsense::AnalysisOutcome::error)
        .def_readonly("error_kind", &qorsense::AnalysisOutcome::error_kind)
        .def_readonly("completed_at", &qorsense::AnalysisOutcome::completed_at)
        .def("to_json", [](const qorsense::AnalysisOutcome& outcome) { return qorsense::to_json(outcome); });

    // None entries in the input list are invalid markers.
    m.def("analyze",
          [](const qorsense::RawSeries& values, const qorsense::AnalysisConfig& config) {
              return qorsense::analyze(values, config);
          },
          py::arg("values"), py::arg("config") = qorsense::AnalysisConfig{});
    m.def("calc_bias", &qorsense::calc_bias, py::arg("values"), py::arg("reference") = 0.0);
    m.def("calc_slope", &qorsense::calc_slope);
    m.def("calc_noise", &qorsense::calc_noise);
    m.def("calc_hysteresis", &qorsense::calc_hysteresis);
    m.def("calc_dfa", [](const std::vector<double>& values) { return qorsense::calc_dfa(values); });
    m.def("compute_descriptors", &qorsense::compute_descriptors);
    m.def("score_health",
          [](const qorsense::DescriptorBundle& bundle, const qorsense::AnalysisConfig& config) {
              return qorsense::score_health(bundle, config);
          });
    m.def("estimate_rul",
          [](const std::vector<double>& values, double slope, const qorsense::AnalysisConfig& config) {
              return qorsense::estimate_rul(values, slope, config);
          });
    m.def("generate_signal",
          [](const std::string& kind, std::size_t length, std::uint64_t seed) {
              return qorsense::generate_signal(qorsense::signal_kind_from_string(kind), length, seed);
          },
          py::arg("kind"), py::arg("length") = 1000, py::arg("seed") = 42);
    m.def("run_analysis_task",
          [](const std::string& sensor_id, const qorsense::RawSeries& values,
             const std::optional<qorsense::AnalysisConfig>& config) {
              return qorsense::run_analysis_task(sensor_id, values, config);
          },
          py::arg("sensor_id"), py::arg("values"), py::arg("config") = py::none());
    m.def("to_json", [](const qorsense::DescriptorBundle& bundle) { return qorsense::to_json(bundle); });
    m.def("to_json", [](const qorsense::HealthAssessment& assessment) { return qorsense::to_json(assessment); });
}
