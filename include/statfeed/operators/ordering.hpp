#pragma once

/// @file ordering.hpp
/// @brief Ranking of options by scheduling value
///
/// The selector ranks every option of a decision by its scheduling value (lower is
/// better) and walks the ranking until an acceptable option is found. This header
/// provides the ranking helpers, built on a total order so that NaN values (which the
/// engine never produces, but callers may pass in) cannot break the sort.

#include <algorithm>
#include <cmath>
#include <numeric>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace statfeed::operators {

/// Strict weak ordering over scheduling values
///
/// Ascending numeric order with +infinity after every finite value and NaN after
/// everything else. NaNs compare equivalent to each other.
struct ScheduleOrder {
    bool operator()(double a, double b) const {
        if (std::isnan(a)) {
            return false;
        }
        if (std::isnan(b)) {
            return true;
        }
        return a < b;
    }
};

/// Rank option indices by ascending scheduling value
///
/// Ties keep the original option order (stable sort), so the ranking is fully
/// determined by the values.
///
/// ## Example Usage:
/// ```cpp
/// std::vector<double> values = {0.3, 0.5, 0.4};
/// auto ranking = rank_options(values); // {0, 2, 1}
/// ```
///
/// @param values Scheduling value per option, indexed by option
/// @return Option indices, best (lowest value) first
inline std::vector<std::size_t> rank_options(std::span<const double> values) {
    std::vector<std::size_t> indices(values.size());
    std::iota(indices.begin(), indices.end(), 0);

    const ScheduleOrder order;
    std::ranges::stable_sort(
        indices, [&](std::size_t a, std::size_t b) { return order(values[a], values[b]); });

    return indices;
}

/// Order option values by ascending scheduling value
///
/// Convenience over rank_options for callers that want the options themselves.
///
/// @throws std::invalid_argument if `options` and `values` differ in length
template <typename T>
std::vector<T> order_options(std::span<const T> options, std::span<const double> values) {
    if (options.size() != values.size()) {
        throw std::invalid_argument("order_options: " + std::to_string(options.size()) +
                                    " options but " + std::to_string(values.size()) + " values");
    }

    std::vector<T> ordered;
    ordered.reserve(options.size());
    for (std::size_t idx : rank_options(values)) {
        ordered.push_back(options[idx]);
    }
    return ordered;
}

} // namespace statfeed::operators
