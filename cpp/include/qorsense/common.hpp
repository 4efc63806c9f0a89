#ifndef QORSENSE_COMMON_HPP
#define QORSENSE_COMMON_HPP

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <ctime>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace qorsense {

inline std::string ltrim(std::string value) {
    auto it = std::find_if_not(value.begin(), value.end(), [](unsigned char ch) {
        return std::isspace(ch) != 0;
    });
    value.erase(value.begin(), it);
    return value;
}

inline std::string rtrim(std::string value) {
    auto it = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char ch) {
        return std::isspace(ch) != 0;
    });
    value.erase(it.base(), value.end());
    return value;
}

inline std::string trim(std::string value) {
    return rtrim(ltrim(std::move(value)));
}

inline std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

inline std::vector<std::string> split(std::string_view value, char delimiter) {
    std::vector<std::string> parts;
    std::string current;
    for (char ch : value) {
        if (ch == delimiter) {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(ch);
        }
    }
    parts.push_back(current);
    return parts;
}

inline std::string strip_quotes(std::string value) {
    if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                              (value.front() == '\'' && value.back() == '\''))) {
        value = value.substr(1, value.size() - 2);
    }
    return value;
}

// Digits only; a sign, whitespace or overflow gives nullopt.
inline std::optional<std::uint64_t> parse_unsigned(std::string_view value) {
    if (value.empty()) {
        return std::nullopt;
    }
    for (char ch : value) {
        if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
            return std::nullopt;
        }
    }
    try {
        return static_cast<std::uint64_t>(std::stoull(std::string(value)));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

inline double seconds_since_epoch() {
    using clock = std::chrono::system_clock;
    auto now = clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

// UTC, second resolution: 2024-01-31T12:00:00Z
inline std::string iso8601_utc(double epoch_seconds) {
    const std::time_t seconds = static_cast<std::time_t>(std::floor(epoch_seconds));
    std::tm tm{};
    gmtime_r(&seconds, &tm);
    char buffer[32] = {0};
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buffer;
}

}  // namespace qorsense

#endif  // QORSENSE_COMMON_HPP
