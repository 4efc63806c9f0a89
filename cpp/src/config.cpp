#include "qorsense/config.hpp"

#include <cmath>
#include <fstream>
#include <string>

#include "qorsense/common.hpp"
#include "qorsense/errors.hpp"

namespace qorsense {

namespace {

bool parse_bool(const std::string& key, const std::string& value) {
    if (value == "true") {
        return true;
    }
    if (value == "false") {
        return false;
    }
    throw ConfigError("invalid boolean for " + key + ": " + value);
}

double parse_double(const std::string& key, const std::string& value) {
    const auto text = strip_quotes(trim(value));
    try {
        size_t consumed = 0;
        const double parsed = std::stod(text, &consumed);
        if (consumed != text.size()) {
            throw ConfigError("invalid number for " + key + ": " + value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw ConfigError("invalid number for " + key + ": " + value);
    }
}

int parse_int(const std::string& key, const std::string& value) {
    const double parsed = parse_double(key, value);
    if (std::floor(parsed) != parsed) {
        throw ConfigError("expected an integer for " + key + ": " + value);
    }
    return static_cast<int>(parsed);
}

std::optional<std::string> parse_optional_string(const std::string& value) {
    auto stripped = strip_quotes(trim(value));
    const auto lowered = to_lower(stripped);
    if (lowered == "null" || lowered == "none") {
        return std::nullopt;
    }
    return stripped;
}

std::optional<double> parse_optional_double(const std::string& key, const std::string& value) {
    auto parsed = parse_optional_string(value);
    if (!parsed.has_value()) {
        return std::nullopt;
    }
    return parse_double(key, *parsed);
}

void require_threshold(const std::string& name, double value) {
    if (!std::isfinite(value) || value < 0.0) {
        throw ConfigError(name + " must be a finite, non-negative number");
    }
}

// Returns false when the key is not an analysis field.
bool assign_analysis_field(AnalysisConfig& config, const std::string& key, const std::string& value) {
    if (key == "slope_critical") {
        config.slope_critical = parse_double(key, value);
    } else if (key == "slope_warning") {
        config.slope_warning = parse_double(key, value);
    } else if (key == "bias_critical") {
        config.bias_critical = parse_double(key, value);
    } else if (key == "bias_warning") {
        config.bias_warning = parse_double(key, value);
    } else if (key == "noise_critical") {
        config.noise_critical = parse_double(key, value);
    } else if (key == "hysteresis_critical") {
        config.hysteresis_critical = parse_double(key, value);
    } else if (key == "dfa_critical") {
        config.dfa_critical = parse_double(key, value);
    } else if (key == "min_data_points") {
        config.min_data_points = parse_int(key, value);
    } else {
        return false;
    }
    return true;
}

bool assign_rul_field(AnalysisConfig& config, const std::string& key, const std::string& value) {
    if (key == "failure_upper") {
        config.failure_upper = parse_optional_double(key, value);
    } else if (key == "failure_lower") {
        config.failure_lower = parse_optional_double(key, value);
    } else if (key == "sample_interval_s") {
        config.sample_interval_s = parse_double(key, value);
    } else if (key == "rul_slope_epsilon" || key == "slope_epsilon") {
        config.rul_slope_epsilon = parse_double(key, value);
    } else {
        return false;
    }
    return true;
}

}  // namespace

void AnalysisConfig::validate() const {
    require_threshold("slope_critical", slope_critical);
    require_threshold("slope_warning", slope_warning);
    require_threshold("bias_critical", bias_critical);
    require_threshold("bias_warning", bias_warning);
    require_threshold("noise_critical", noise_critical);
    require_threshold("hysteresis_critical", hysteresis_critical);
    require_threshold("dfa_critical", dfa_critical);
    if (slope_warning > slope_critical) {
        throw ConfigError("slope_warning must not exceed slope_critical");
    }
    if (bias_warning > bias_critical) {
        throw ConfigError("bias_warning must not exceed bias_critical");
    }
    if (min_data_points < 5) {
        throw ConfigError("min_data_points must be at least 5");
    }
    if (!std::isfinite(sample_interval_s) || sample_interval_s <= 0.0) {
        throw ConfigError("sample_interval_s must be positive");
    }
    if (!std::isfinite(rul_slope_epsilon) || rul_slope_epsilon <= 0.0) {
        throw ConfigError("rul_slope_epsilon must be positive");
    }
    if ((failure_upper.has_value() && !std::isfinite(*failure_upper)) ||
        (failure_lower.has_value() && !std::isfinite(*failure_lower))) {
        throw ConfigError("failure boundaries must be finite");
    }
    if (failure_upper.has_value() && failure_lower.has_value() && *failure_lower >= *failure_upper) {
        throw ConfigError("failure_lower must be below failure_upper");
    }
}

AnalysisConfig AnalysisConfig::from_fields(const std::map<std::string, std::string>& fields) {
    AnalysisConfig config;
    for (const auto& [key, value] : fields) {
        if (!assign_analysis_field(config, key, value) && !assign_rul_field(config, key, value)) {
            throw ConfigError("unknown analysis field: " + key);
        }
    }
    config.validate();
    return config;
}

EngineSettings EngineSettings::from_toml(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("unable to open config file: " + path);
    }

    EngineSettings settings;
    std::string current_section;
    std::string line;
    int line_number = 0;

    while (std::getline(file, line)) {
        line_number += 1;
        const std::string where = path + ":" + std::to_string(line_number);
        auto hash_pos = line.find('#');
        if (hash_pos != std::string::npos) {
            line = line.substr(0, hash_pos);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }
        if (line.front() == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            if (current_section != "logging" && current_section != "analysis" && current_section != "rul" &&
                current_section != "reading") {
                throw ConfigError(where + ": unknown section [" + current_section + "]");
            }
            continue;
        }
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            throw ConfigError(where + ": expected key = value");
        }
        auto key = trim(line.substr(0, eq_pos));
        auto value = trim(line.substr(eq_pos + 1));

        bool known = true;
        if (current_section == "logging") {
            if (key == "level") {
                settings.logging.level = strip_quotes(value);
            } else if (key == "json") {
                settings.logging.json = parse_bool(key, value);
            } else if (key == "log_file") {
                settings.logging.log_file = parse_optional_string(value);
            } else if (key == "max_bytes") {
                settings.logging.max_bytes = parse_int(key, value);
            } else if (key == "backup_count") {
                settings.logging.backup_count = parse_int(key, value);
            } else {
                known = false;
            }
        } else if (current_section == "analysis") {
            known = assign_analysis_field(settings.analysis, key, value);
        } else if (current_section == "rul") {
            known = assign_rul_field(settings.analysis, key, value);
        } else if (current_section == "reading") {
            if (key == "default_window_size") {
                settings.reading.default_window_size = parse_int(key, value);
            } else if (key == "max_analysis_points") {
                settings.reading.max_analysis_points = parse_int(key, value);
            } else {
                known = false;
            }
        } else {
            known = false;
        }
        if (!known) {
            const std::string section = current_section.empty() ? "<root>" : current_section;
            throw ConfigError(where + ": unknown key '" + key + "' in [" + section + "]");
        }
    }

    const auto& level = settings.logging.level;
    if (level != "DEBUG" && level != "INFO" && level != "WARN" && level != "ERROR") {
        throw ConfigError("logging.level must be DEBUG, INFO, WARN or ERROR");
    }
    if (settings.reading.default_window_size < 5 || settings.reading.max_analysis_points < 5) {
        throw ConfigError("reading window sizes must be at least 5");
    }
    settings.analysis.validate();
    return settings;
}

}  // namespace qorsense
