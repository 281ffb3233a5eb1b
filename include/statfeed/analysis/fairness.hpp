#pragma once

/// @file fairness.hpp
/// @brief Frequency analysis of selector runs
///
/// Compares how often each option was chosen against how often its weights say it
/// should have been chosen. The expected count of option o over a run is the sum of its
/// per-decision weight share, `sum_d weights[d][o] / sum_o' weights[d][o']`.

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include <statfeed/core/plan.hpp>
#include <statfeed/core/selector.hpp>

namespace statfeed::analysis {

using core::statistics_spread;

/// Per-option comparison of observed and weight-implied selection frequencies
struct OptionFairness {
    std::size_t observed = 0; // Times the option was chosen
    double expected = 0.0;    // Weight-implied number of selections
    double observed_share = 0.0;
    double expected_share = 0.0;

    double deviation() const { return static_cast<double>(observed) - expected; }
};

/// Fairness summary of a complete run
struct FairnessReport {
    std::vector<OptionFairness> options;
    std::size_t decisions = 0;
    double max_abs_deviation = 0.0; // Largest |observed - expected| over all options

    /// Largest |observed_share - expected_share| over all options
    double max_share_error() const {
        double worst = 0.0;
        for (const auto& opt : options) {
            worst = std::max(worst, std::abs(opt.observed_share - opt.expected_share));
        }
        return worst;
    }
};

/// Compare the chosen option indices of a run against its weight matrix
///
/// Rows whose weights sum to zero contribute nothing to the expectation (no option
/// could have been chosen there).
///
/// @param chosen_indices Option index chosen at each decision
/// @param weights Weight matrix of the run, one row per decision
/// @param num_options Number of options N
///
/// @throws std::invalid_argument if the run and the matrix disagree in length, a row
///         is not N wide, or an index is out of range
inline FairnessReport analyze_fairness(std::span<const std::size_t> chosen_indices,
                                       const core::Matrix& weights, std::size_t num_options) {
    if (chosen_indices.size() != weights.size()) {
        throw std::invalid_argument("analyze_fairness: " + std::to_string(chosen_indices.size()) +
                                    " choices but " + std::to_string(weights.size()) +
                                    " weight rows");
    }

    FairnessReport report;
    report.decisions = chosen_indices.size();
    report.options.resize(num_options);

    for (std::size_t dec = 0; dec < weights.size(); ++dec) {
        const auto& row = weights[dec];
        if (row.size() != num_options) {
            throw std::invalid_argument("analyze_fairness: weight row " + std::to_string(dec) +
                                        " has " + std::to_string(row.size()) + " entries");
        }
        const double total = std::accumulate(row.begin(), row.end(), 0.0);
        if (total > 0.0) {
            for (std::size_t opt = 0; opt < num_options; ++opt) {
                report.options[opt].expected += row[opt] / total;
            }
        }

        const std::size_t chosen = chosen_indices[dec];
        if (chosen >= num_options) {
            throw std::invalid_argument("analyze_fairness: option index " +
                                        std::to_string(chosen) + " out of range");
        }
        report.options[chosen].observed++;
    }

    if (report.decisions > 0) {
        const double n = static_cast<double>(report.decisions);
        for (auto& opt : report.options) {
            opt.observed_share = static_cast<double>(opt.observed) / n;
            opt.expected_share = opt.expected / n;
            report.max_abs_deviation = std::max(report.max_abs_deviation, std::abs(opt.deviation()));
        }
    }

    return report;
}

/// Fairness report of a selector's most recent run
template <typename SelectorT>
FairnessReport analyze_fairness(const SelectorT& selector) {
    return analyze_fairness(selector.chosen_indices(), selector.weights(),
                            selector.options().size());
}

} // namespace statfeed::analysis
