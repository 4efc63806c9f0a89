#ifndef QORSENSE_CONFIG_HPP
#define QORSENSE_CONFIG_HPP

#include <map>
#include <optional>
#include <string>

namespace qorsense {

struct LoggingConfig {
    std::string level = "INFO";
    bool json = true;
    std::optional<std::string> log_file = std::nullopt;
    int max_bytes = 10'485'760;
    int backup_count = 5;
};

// Thresholds for health classification plus the RUL projection parameters.
// Never alters descriptor math.
struct AnalysisConfig {
    double slope_critical = 0.1;
    double slope_warning = 0.05;
    double bias_critical = 2.0;
    double bias_warning = 1.0;
    double noise_critical = 1.5;
    double hysteresis_critical = 5.0;
    double dfa_critical = 0.8;
    int min_data_points = 5;

    std::optional<double> failure_upper = std::nullopt;
    std::optional<double> failure_lower = std::nullopt;
    double sample_interval_s = 1.0;
    double rul_slope_epsilon = 1e-6;

    void validate() const;

    // Unknown field names are rejected, never ignored.
    static AnalysisConfig from_fields(const std::map<std::string, std::string>& fields);
};

struct ReadingConfig {
    int default_window_size = 1000;
    int max_analysis_points = 10000;
};

struct EngineSettings {
    LoggingConfig logging{};
    AnalysisConfig analysis{};
    ReadingConfig reading{};

    static EngineSettings from_toml(const std::string& path);
};

}  // namespace qorsense

#endif  // QORSENSE_CONFIG_HPP
