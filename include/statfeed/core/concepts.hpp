#pragma once

#include <concepts>
#include <cstddef>
#include <random>
#include <type_traits>

namespace statfeed::core {

/// Concept for acceptability predicates consulted by the selector
///
/// After ranking the options of a decision by scheduling value, the selector walks
/// the ranking and picks the first option the predicate accepts. Predicates let a
/// caller exclude options that are unavailable at a given decision without touching
/// the engine itself.
///
/// ## Requirements:
/// - `predicate.accepts(option, option_index, decision)` returns whether `option`
///   (found at `option_index` in the option set) may be chosen at `decision`
/// - Must be callable on a const predicate
/// - Should be deterministic; the engine assumes repeated calls agree
///
/// @see AcceptAll, FunctionAcceptance, AvailabilityMask for implementations
template <typename A, typename T>
concept AcceptancePredicate =
    requires(const A& predicate, const T& option, std::size_t option_index, std::size_t decision) {
        { predicate.accepts(option, option_index, decision) } -> std::convertible_to<bool>;
    };

/// Random source used to draw the default perturbation matrix
///
/// Any standard uniform random bit generator qualifies (std::mt19937, std::mt19937_64,
/// std::minstd_rand, ...). Values are mapped to [0, 1) with
/// std::uniform_real_distribution.
template <typename G>
concept UniformRandomSource = std::uniform_random_bit_generator<std::remove_cvref_t<G>>;

/// Option types the selector can store and hand back as choices
template <typename T>
concept OptionValue = std::copy_constructible<T>;

} // namespace statfeed::core
