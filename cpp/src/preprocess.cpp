#include "qorsense/preprocess.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "qorsense/common.hpp"
#include "qorsense/errors.hpp"

namespace qorsense {

namespace {

constexpr int kAbsoluteMinimumPoints = 5;

bool is_missing_token(const std::string& token) {
    const auto lowered = to_lower(token);
    return lowered.empty() || lowered == "nan" || lowered == "null" || lowered == "none" || lowered == "na";
}

std::optional<double> parse_token(const std::string& token, std::size_t position) {
    if (is_missing_token(token)) {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        const double value = std::stod(token, &consumed);
        if (consumed == token.size()) {
            return value;
        }
    } catch (const std::out_of_range&) {
        // Overflowing literals are readings the sensor could not represent.
        return std::nullopt;
    } catch (const std::invalid_argument&) {
    }
    throw InvalidInputError("non-numeric reading '" + token + "' at position " + std::to_string(position));
}

}  // namespace

RawSeries to_raw_series(const std::vector<double>& values) {
    return RawSeries(values.begin(), values.end());
}

CleanSeries preprocess(const RawSeries& raw) {
    CleanSeries clean;
    clean.values.reserve(raw.size());
    for (const auto& reading : raw) {
        if (reading.has_value() && std::isfinite(*reading)) {
            clean.values.push_back(*reading);
        } else {
            clean.dropped += 1;
        }
    }
    return clean;
}

CleanSeries preprocess(const std::vector<double>& raw) {
    CleanSeries clean;
    clean.values.reserve(raw.size());
    for (double reading : raw) {
        if (std::isfinite(reading)) {
            clean.values.push_back(reading);
        } else {
            clean.dropped += 1;
        }
    }
    return clean;
}

bool has_minimum_points(const CleanSeries& series, int min_points) {
    const int required = std::max(min_points, kAbsoluteMinimumPoints);
    return series.size() >= static_cast<std::size_t>(required);
}

RawSeries parse_series(const std::string& text) {
    std::string normalized;
    normalized.reserve(text.size());
    for (char ch : text) {
        if (ch == '\r') {
            continue;
        }
        normalized.push_back(ch == '\n' || ch == '\t' || ch == ';' ? ',' : ch);
    }
    auto fields = split(normalized, ',');
    while (!fields.empty() && trim(fields.back()).empty()) {
        fields.pop_back();
    }

    RawSeries series;
    for (const auto& field : fields) {
        const auto trimmed = trim(field);
        if (trimmed.empty()) {
            series.push_back(std::nullopt);
            continue;
        }
        for (const auto& token : split(trimmed, ' ')) {
            if (token.empty()) {
                continue;
            }
            series.push_back(parse_token(token, series.size()));
        }
    }
    return series;
}

}  // namespace qorsense
