#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <utility>
#include <vector>

// Core components
#include "core/concepts.hpp"
#include "core/errors.hpp"
#include "core/plan.hpp"
#include "core/selector.hpp"

// Operators
#include "operators/acceptance.hpp"
#include "operators/ordering.hpp"

// Analysis
#include "analysis/fairness.hpp"

// Configuration
#include "config/config.hpp"

/**
 * @file statfeed.hpp
 * @brief Main header for Statfeed - weight-proportional, fairness-corrected selection
 *
 * Statfeed picks one option per decision slot so that, over many decisions, each option
 * is chosen with a frequency proportional to its weight. A running per-option debt
 * statistic compensates for past picks, and a small random perturbation breaks ties.
 *
 * Basic usage:
 * @code
 * #include <statfeed/statfeed.hpp>
 * using namespace statfeed;
 *
 * auto selector = factory::make_selector<std::string>({"a", "b", "c"}, 30, 42);
 * selector.populate_choices();
 *
 * auto report = analysis::analyze_fairness(selector);
 * std::cout << "Worst share error: " << report.max_share_error() << std::endl;
 * @endcode
 */

namespace statfeed {

/// Current version
constexpr const char* VERSION = "0.1.0";

/// Common type aliases
namespace types {
using Matrix = core::Matrix;
using DecisionPlan = core::DecisionPlan;

template <typename T>
using Selector = core::Selector<T>;
} // namespace types

/// Factory functions for common configurations
namespace factory {

/// Create a selector whose perturbation matrix is drawn from std::mt19937 seeded with `seed`
template <typename T>
inline core::Selector<T> make_selector(std::vector<T> options, std::size_t size,
                                       std::uint64_t seed, core::SelectorConfig config = {}) {
    std::mt19937 rng(static_cast<std::mt19937::result_type>(seed));
    return core::Selector<T>(std::move(options), size, rng, config);
}

/// Create a selector over the configured option names with the configured plan
inline core::Selector<std::string> make_selector_from_config(const config::Config& cfg) {
    std::mt19937 rng(static_cast<std::mt19937::result_type>(cfg.selector.seed));
    core::Selector<std::string> selector(cfg.options.names, cfg.selector.size, rng,
                                         cfg.to_selector_config());
    selector.configure(cfg.to_plan(selector.randoms()));
    return selector;
}

/// Same as make_selector_from_config with a different seed (for replica studies)
inline core::Selector<std::string> make_selector_from_config(const config::Config& cfg,
                                                             std::uint64_t seed) {
    config::Config seeded = cfg;
    seeded.selector.seed = seed;
    return make_selector_from_config(seeded);
}

} // namespace factory

} // namespace statfeed
