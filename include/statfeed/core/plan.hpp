#pragma once

/// @file plan.hpp
/// @brief Per-decision configuration of the selector engine
///
/// A DecisionPlan bundles the four per-decision inputs of the engine (weights,
/// perturbation randoms, heterogeneities and accents). Callers replace the defaults
/// drawn at construction by handing a validated plan to Selector::configure, which
/// keeps the dimension invariants intact at the boundary.

#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

#include <statfeed/core/errors.hpp>

namespace statfeed::core {

/// Row-major matrix indexed as [decision][option]
using Matrix = std::vector<std::vector<double>>;

/// Weight accounting policy applied after every decision
///
/// The increment that settles a decision is charged either to the chosen option
/// (fairness correction proper) or to the statistic sitting at the chosen option's
/// position in the ranked order. The latter reproduces the bookkeeping of earlier
/// releases and exists to keep their recorded outputs reproducible.
enum class ChargePolicy {
    chosen_option,
    rank_position,
};

inline std::string to_string(ChargePolicy policy) {
    switch (policy) {
    case ChargePolicy::chosen_option:
        return "chosen_option";
    case ChargePolicy::rank_position:
        return "rank_position";
    }
    return "chosen_option";
}

/// Parse a charge policy name; throws InvalidConfiguration on unknown names
inline ChargePolicy charge_policy_from_string(const std::string& name) {
    if (name == "chosen_option") {
        return ChargePolicy::chosen_option;
    }
    if (name == "rank_position") {
        return ChargePolicy::rank_position;
    }
    throw InvalidConfiguration("Unknown charge policy: '" + name + "'");
}

/// Scalar engine parameters, applied to every decision at construction
struct SelectorConfig {
    double heterogeneity = 0.1; // Perturbation strength for every decision
    double accent = 1.0;        // Base cost / normalization scale for every decision
    ChargePolicy charge_policy = ChargePolicy::chosen_option;
    std::size_t trace_interval = 0; // Record every N-th decision; 0 disables the trace

    /// Throws InvalidConfiguration if a coefficient is negative or non-finite
    void validate() const {
        if (!std::isfinite(heterogeneity) || heterogeneity < 0.0) {
            throw InvalidConfiguration("Heterogeneity must be finite and non-negative");
        }
        if (!std::isfinite(accent) || accent < 0.0) {
            throw InvalidConfiguration("Accent must be finite and non-negative");
        }
    }
};

/// Complete per-decision input of the engine
struct DecisionPlan {
    Matrix weights;                      // M x N relative priorities
    Matrix randoms;                      // M x N perturbation draws
    std::vector<double> heterogeneities; // M perturbation strengths
    std::vector<double> accents;         // M base cost scales

    /// Number of decisions described by the plan
    std::size_t decisions() const { return weights.size(); }

    /// Validate the plan against an option set of size `options_count`
    ///
    /// @throws InvalidConfiguration on any dimension mismatch, a non-finite random value
    ///         or a negative/non-finite heterogeneity or accent
    /// @throws DegenerateWeight on a negative or non-finite weight cell
    void validate(std::size_t options_count) const {
        const std::size_t m = weights.size();
        if (randoms.size() != m || heterogeneities.size() != m || accents.size() != m) {
            throw InvalidConfiguration(
                "Plan dimensions disagree: weights=" + std::to_string(m) +
                ", randoms=" + std::to_string(randoms.size()) +
                ", heterogeneities=" + std::to_string(heterogeneities.size()) +
                ", accents=" + std::to_string(accents.size()));
        }
        validate_matrix_shape(weights, m, options_count, "weights");
        validate_matrix_shape(randoms, m, options_count, "randoms");

        for (std::size_t d = 0; d < m; ++d) {
            for (std::size_t o = 0; o < options_count; ++o) {
                const double w = weights[d][o];
                if (!std::isfinite(w) || w < 0.0) {
                    throw DegenerateWeight(d, o, w);
                }
                if (!std::isfinite(randoms[d][o])) {
                    throw InvalidConfiguration("Random value at decision " + std::to_string(d) +
                                               ", option " + std::to_string(o) +
                                               " must be finite");
                }
            }
            if (!std::isfinite(heterogeneities[d]) || heterogeneities[d] < 0.0) {
                throw InvalidConfiguration("Heterogeneity at decision " + std::to_string(d) +
                                           " must be finite and non-negative");
            }
            if (!std::isfinite(accents[d]) || accents[d] < 0.0) {
                throw InvalidConfiguration("Accent at decision " + std::to_string(d) +
                                           " must be finite and non-negative");
            }
        }
    }

    /// Check that `matrix` has `rows` rows of `columns` entries each
    static void validate_matrix_shape(const Matrix& matrix, std::size_t rows, std::size_t columns,
                                      const std::string& name) {
        if (matrix.size() != rows) {
            throw InvalidConfiguration(name + " must have " + std::to_string(rows) +
                                       " rows (got " + std::to_string(matrix.size()) + ")");
        }
        for (std::size_t d = 0; d < rows; ++d) {
            if (matrix[d].size() != columns) {
                throw InvalidConfiguration(name + " row " + std::to_string(d) + " must have " +
                                           std::to_string(columns) + " entries (got " +
                                           std::to_string(matrix[d].size()) + ")");
            }
        }
    }
};

} // namespace statfeed::core
