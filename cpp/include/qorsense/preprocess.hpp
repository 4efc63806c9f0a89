#ifndef QORSENSE_PREPROCESS_HPP
#define QORSENSE_PREPROCESS_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace qorsense {

// Chronological readings; nullopt, NaN and +/-Inf are invalid markers.
using RawSeries = std::vector<std::optional<double>>;

struct CleanSeries {
    std::vector<double> values;
    std::size_t dropped = 0;

    std::size_t size() const { return values.size(); }
    bool empty() const { return values.empty(); }
};

RawSeries to_raw_series(const std::vector<double>& values);

// Drops invalid markers, keeps order.
CleanSeries preprocess(const RawSeries& raw);
CleanSeries preprocess(const std::vector<double>& raw);

// Insufficient data is an expected outcome, reported as false rather than thrown.
bool has_minimum_points(const CleanSeries& series, int min_points);

// Comma/whitespace separated numbers. Blank, nan, null, none and na tokens become
// invalid markers; anything else non-numeric throws InvalidInputError.
RawSeries parse_series(const std::string& text);

}  // namespace qorsense

#endif  // QORSENSE_PREPROCESS_HPP
