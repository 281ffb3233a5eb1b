#pragma once

/// @file selector.hpp
/// @brief Weight-proportional, fairness-corrected selection engine
///
/// The Selector picks one option per decision slot so that, over many decisions, every
/// option is chosen with a frequency proportional to its weight. Each option carries a
/// running "fairness debt" statistic: picking an option raises its debt, and after every
/// decision all participating options are lowered by the same amount. The option with
/// the lowest projected debt wins the next decision, with a small random perturbation
/// breaking ties between otherwise identical options.

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <numeric>
#include <random>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <statfeed/core/concepts.hpp>
#include <statfeed/core/errors.hpp>
#include <statfeed/core/plan.hpp>
#include <statfeed/operators/acceptance.hpp>
#include <statfeed/operators/ordering.hpp>

namespace statfeed::core {

/// Snapshot of one settled decision, recorded every `trace_interval` decisions
struct DecisionRecord {
    std::size_t decision;
    std::size_t option_index;  // Option chosen at this decision
    double scheduling_value;   // Value the chosen option won with
    double statistics_spread;  // max - min of the statistics after settling
};

/// Difference between the largest and smallest statistic (0 for empty input)
inline double statistics_spread(std::span<const double> statistics) {
    if (statistics.empty()) {
        return 0.0;
    }
    const auto [min_it, max_it] = std::minmax_element(statistics.begin(), statistics.end());
    return *max_it - *min_it;
}

/// Stateful selection engine over a fixed option set and a fixed number of decisions
///
/// ## Algorithm (per decision d, in order 0..M):
/// 1. Score every option o:
///    `value(d, o) = statistics[o] + (accents[d] + heterogeneities[d] * randoms[d][o]) / weights[d][o]`
///    A zero weight scores +infinity, which excludes the option at that decision.
/// 2. Rank options by ascending value and choose the first one with a finite value that
///    the acceptance predicate accepts.
/// 3. Settle: add `accents[d] / weights[d][chosen]` to the chosen option's statistic,
///    then subtract `accents[d] / sum(weights[d])` from every option with positive weight.
///
/// Decisions are strictly sequential: settling decision d changes the statistics that
/// decision d+1 is scored against.
///
/// ## Example Usage:
/// ```cpp
/// std::mt19937 rng(42);
/// Selector<std::string> selector({"red", "green", "blue"}, 100, rng);
///
/// auto weights = selector.weights();
/// for (auto& row : weights) {
///     row = {0.5, 0.3, 0.2};
/// }
/// selector.set_weights(std::move(weights));
///
/// selector.populate_choices();
/// for (const auto& colour : selector.choices()) {
///     std::cout << colour << "\n";
/// }
/// ```
///
/// ## Thread Safety:
/// No internal synchronization. A Selector must not be used from several threads at
/// once; run independent instances instead (see parallel::TBBReplicator).
///
/// @tparam T Option type, copied into the choices sequence
/// @tparam Acceptance Predicate deciding which options may be chosen at a decision
template <OptionValue T, typename Acceptance = operators::AcceptAll>
    requires AcceptancePredicate<Acceptance, T>
class Selector {
  public:
    using OptionT = T;
    using AcceptanceT = Acceptance;

  private:
    std::vector<T> options_;
    DecisionPlan plan_;
    SelectorConfig config_;
    Acceptance acceptance_;

    std::vector<double> statistics_;
    std::vector<T> choices_;
    std::vector<std::size_t> chosen_indices_;
    std::vector<DecisionRecord> trace_;

  public:
    /// Build an engine with default weights and freshly drawn randoms
    ///
    /// Weights default to `1/N` for every cell, heterogeneities to
    /// `config.heterogeneity`, accents to `config.accent`. The perturbation matrix is
    /// drawn from `rng` in decision-major order, uniformly in [0, 1).
    ///
    /// @param options Candidate options, at least one
    /// @param size Number of decisions M (0 is allowed)
    /// @param rng Random source for the default perturbation matrix
    /// @param config Scalar defaults and bookkeeping policy
    /// @param acceptance Acceptability predicate
    ///
    /// @throws InvalidConfiguration if `options` is empty or `config` is invalid
    template <UniformRandomSource G>
    Selector(std::vector<T> options, std::size_t size, G& rng, SelectorConfig config = {},
             Acceptance acceptance = {})
        : options_(std::move(options)), config_(config), acceptance_(std::move(acceptance)) {
        if (options_.empty()) {
            throw InvalidConfiguration("Selector requires at least one option");
        }
        config_.validate();

        plan_ = default_plan(options_.size(), size, rng, config_);
        statistics_.assign(options_.size(), 0.0);
        choices_.reserve(size);
        chosen_indices_.reserve(size);
    }

    /// Build an engine from an explicit plan
    ///
    /// The number of decisions is taken from the plan.
    ///
    /// @throws InvalidConfiguration if `options` is empty or the plan does not match it
    /// @throws DegenerateWeight if the plan contains a negative or non-finite weight
    Selector(std::vector<T> options, DecisionPlan plan, SelectorConfig config = {},
             Acceptance acceptance = {})
        : options_(std::move(options)), config_(config), acceptance_(std::move(acceptance)) {
        if (options_.empty()) {
            throw InvalidConfiguration("Selector requires at least one option");
        }
        config_.validate();
        plan.validate(options_.size());

        plan_ = std::move(plan);
        statistics_.assign(options_.size(), 0.0);
        choices_.reserve(plan_.decisions());
        chosen_indices_.reserve(plan_.decisions());
    }

    /// Replace the whole per-decision plan
    ///
    /// The plan must describe exactly `size()` decisions over `options().size()` options.
    /// On failure the current plan is left untouched.
    void configure(DecisionPlan plan) {
        if (plan.decisions() != size()) {
            throw InvalidConfiguration("Plan describes " + std::to_string(plan.decisions()) +
                                       " decisions, selector has " + std::to_string(size()));
        }
        plan.validate(options_.size());
        plan_ = std::move(plan);
    }

    void set_weights(Matrix weights) {
        DecisionPlan plan = plan_;
        plan.weights = std::move(weights);
        configure(std::move(plan));
    }

    void set_randoms(Matrix randoms) {
        DecisionPlan plan = plan_;
        plan.randoms = std::move(randoms);
        configure(std::move(plan));
    }

    void set_heterogeneities(std::vector<double> heterogeneities) {
        DecisionPlan plan = plan_;
        plan.heterogeneities = std::move(heterogeneities);
        configure(std::move(plan));
    }

    void set_accents(std::vector<double> accents) {
        DecisionPlan plan = plan_;
        plan.accents = std::move(accents);
        configure(std::move(plan));
    }

    /// Choose one option for every decision, in decision order
    ///
    /// Rebuilds choices(), chosen_indices() and trace() from scratch. Statistics carry
    /// over from any previous run; call reset_statistics() first for an independent run.
    ///
    /// Strong exception guarantee: all work happens on copies that are committed only
    /// after the last decision settled, so a failing call leaves the engine unchanged.
    ///
    /// @throws NoAcceptableOption if a decision has no acceptable option with a finite
    ///         scheduling value (for example an all-zero weight row)
    void populate_choices() {
        const std::size_t m = size();

        std::vector<double> statistics = statistics_;
        std::vector<T> choices;
        std::vector<std::size_t> indices;
        std::vector<DecisionRecord> trace;
        choices.reserve(m);
        indices.reserve(m);

        for (std::size_t dec = 0; dec < m; ++dec) {
            const auto values = scheduling_values(dec, statistics);
            const auto ranking = operators::rank_options(values);
            const std::size_t rank = select_rank(dec, ranking, values);
            const std::size_t chosen = ranking[rank];

            choices.push_back(options_[chosen]);
            indices.push_back(chosen);

            const std::size_t charged =
                config_.charge_policy == ChargePolicy::chosen_option ? chosen : rank;
            statistics[charged] += true_increment(dec, charged);
            normalize_statistics(dec, statistics);

            if (config_.trace_interval > 0 && dec % config_.trace_interval == 0) {
                trace.push_back(
                    DecisionRecord{dec, chosen, values[chosen], statistics_spread(statistics)});
            }
        }

        statistics_ = std::move(statistics);
        choices_ = std::move(choices);
        chosen_indices_ = std::move(indices);
        trace_ = std::move(trace);
    }

    /// Zero the statistics and discard the results of previous runs
    void reset_statistics() {
        std::fill(statistics_.begin(), statistics_.end(), 0.0);
        choices_.clear();
        chosen_indices_.clear();
        trace_.clear();
    }

    /// Base cost charged to `option` when it is chosen at `decision`
    ///
    /// `accents[decision] / weights[decision][option]`; +infinity for a zero weight.
    /// @throws std::out_of_range for an invalid decision or option index
    double true_increment(std::size_t decision, std::size_t option) const {
        const double weight = plan_.weights.at(decision).at(option);
        if (weight == 0.0) {
            return std::numeric_limits<double>::infinity();
        }
        return plan_.accents[decision] / weight;
    }

    /// Perturbed increment used for ranking
    ///
    /// `(accents[d] + heterogeneities[d] * randoms[d][o]) / weights[d][o]`;
    /// +infinity for a zero weight.
    /// @throws std::out_of_range for an invalid decision or option index
    double expected_increment(std::size_t decision, std::size_t option) const {
        const double weight = plan_.weights.at(decision).at(option);
        if (weight == 0.0) {
            return std::numeric_limits<double>::infinity();
        }
        return (plan_.accents[decision] +
                plan_.heterogeneities[decision] * plan_.randoms[decision][option]) /
               weight;
    }

    /// Amount subtracted from every participating statistic after `decision`
    ///
    /// `accents[decision] / sum(weights[decision])`; +infinity when the row sums to 0.
    double normalization_value(std::size_t decision) const {
        const auto& row = plan_.weights.at(decision);
        const double total = std::accumulate(row.begin(), row.end(), 0.0);
        if (total == 0.0) {
            return std::numeric_limits<double>::infinity();
        }
        return plan_.accents[decision] / total;
    }

    /// Scheduling value of every option at `decision` against the current statistics
    std::vector<double> scheduling_values(std::size_t decision) const {
        return scheduling_values(decision, statistics_);
    }

    /// Option values ordered by ascending `values` (one value per option)
    std::vector<T> sort_options(std::span<const double> values) const {
        return operators::order_options<T>(options_, values);
    }

    const std::vector<T>& options() const { return options_; }
    std::size_t size() const { return plan_.decisions(); }

    const DecisionPlan& plan() const { return plan_; }
    const Matrix& weights() const { return plan_.weights; }
    const Matrix& randoms() const { return plan_.randoms; }
    const std::vector<double>& heterogeneities() const { return plan_.heterogeneities; }
    const std::vector<double>& accents() const { return plan_.accents; }

    const std::vector<double>& statistics() const { return statistics_; }
    const std::vector<T>& choices() const { return choices_; }
    const std::vector<std::size_t>& chosen_indices() const { return chosen_indices_; }
    const std::vector<DecisionRecord>& trace() const { return trace_; }

    const SelectorConfig& config() const { return config_; }
    const Acceptance& acceptance() const { return acceptance_; }

  private:
    template <typename G>
    static DecisionPlan default_plan(std::size_t num_options, std::size_t size, G& rng,
                                     const SelectorConfig& config) {
        DecisionPlan plan;
        const double uniform_weight = 1.0 / static_cast<double>(num_options);
        plan.weights.assign(size, std::vector<double>(num_options, uniform_weight));

        std::uniform_real_distribution<double> dist(0.0, 1.0);
        plan.randoms.resize(size);
        for (auto& row : plan.randoms) {
            row.resize(num_options);
            for (auto& value : row) {
                value = dist(rng);
            }
        }

        plan.heterogeneities.assign(size, config.heterogeneity);
        plan.accents.assign(size, config.accent);
        return plan;
    }

    std::vector<double> scheduling_values(std::size_t decision,
                                          const std::vector<double>& statistics) const {
        std::vector<double> values(options_.size());
        for (std::size_t opt = 0; opt < options_.size(); ++opt) {
            values[opt] = statistics[opt] + expected_increment(decision, opt);
        }
        return values;
    }

    /// Position in `ranking` of the first option that may be chosen at `decision`
    std::size_t select_rank(std::size_t decision, const std::vector<std::size_t>& ranking,
                            const std::vector<double>& values) const {
        for (std::size_t rank = 0; rank < ranking.size(); ++rank) {
            const std::size_t idx = ranking[rank];
            // Infinite and NaN values sort last, so nothing acceptable follows them
            if (!std::isfinite(values[idx])) {
                break;
            }
            if (acceptance_.accepts(options_[idx], idx, decision)) {
                return rank;
            }
        }
        throw NoAcceptableOption(decision);
    }

    void normalize_statistics(std::size_t decision, std::vector<double>& statistics) const {
        const double amount = normalization_value(decision);
        const auto& row = plan_.weights[decision];
        for (std::size_t opt = 0; opt < statistics.size(); ++opt) {
            if (row[opt] > 0.0) {
                statistics[opt] -= amount;
            }
        }
    }
};

} // namespace statfeed::core
