#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <optional>
#include <vector>

namespace stats {

/**
 * @brief Collect the present values of a column, skipping missing cells.
 */
[[nodiscard]] inline std::vector<double> present(const std::vector<std::optional<double>>& column) {
    std::vector<double> result;
    result.reserve(column.size());
    for (const auto& v : column) {
        if (v) {
            result.push_back(*v);
        }
    }
    return result;
}

/**
 * @brief Median of a sample.
 * @param values Input sample (copied, then partially sorted).
 * @return       Median, or std::nullopt for an empty sample.
 *               Even-sized samples average the two middle values.
 */
[[nodiscard]] inline std::optional<double> median(std::vector<double> values) {
    if (values.empty()) {
        return std::nullopt;
    }

    const std::size_t mid = values.size() / 2;
    std::nth_element(values.begin(), values.begin() + static_cast<long>(mid), values.end());
    const double upper = values[mid];

    if (values.size() % 2 == 1) {
        return upper;
    }

    const double lower = *std::max_element(values.begin(), values.begin() + static_cast<long>(mid));
    return (lower + upper) / 2.0;
}

/**
 * @brief Arithmetic mean. Returns 0.0 for an empty sample.
 */
[[nodiscard]] inline double mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

/**
 * @brief Population standard deviation (divides by N, not N - 1).
 */
[[nodiscard]] inline double populationStdDev(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }

    const double m = mean(values);

    double variance = 0.0;
    for (const auto& v : values) {
        variance += (v - m) * (v - m);
    }
    variance /= static_cast<double>(values.size());

    return std::sqrt(variance);
}

/**
 * @brief Population z-scores of a sample.
 * @return One z-score per input value. A constant sample, or one whose spread
 *         is rounding noise relative to its magnitude, yields all zeros.
 */
[[nodiscard]] inline std::vector<double> zScores(const std::vector<double>& values) {
    std::vector<double> result(values.size(), 0.0);
    if (values.empty()) {
        return result;
    }

    const bool constant =
        std::all_of(values.begin(), values.end(), [first = values.front()](double v) { return v == first; });
    if (constant) {
        return result;
    }

    const double m      = mean(values);
    const double stdDev = populationStdDev(values);
    if (stdDev <= 1e-12 * std::max(1.0, std::abs(m))) {
        return result;
    }

    for (std::size_t i = 0; i < values.size(); ++i) {
        result[i] = (values[i] - m) / stdDev;
    }
    return result;
}

/**
 * @brief Round to a fixed number of decimal places (half away from zero).
 */
[[nodiscard]] inline double round(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

}  // namespace stats
