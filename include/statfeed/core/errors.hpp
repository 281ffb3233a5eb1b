#pragma once

/// @file errors.hpp
/// @brief Exception types raised by the selector engine

#include <cstddef>
#include <stdexcept>
#include <string>

namespace statfeed::core {

/// Base class for every error raised by the selector engine
class SelectorError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/// Engine inputs violate a structural invariant (empty option set, mismatched
/// dimensions, non-finite coefficients)
class InvalidConfiguration : public SelectorError {
  public:
    using SelectorError::SelectorError;
};

/// A weight cell is negative, NaN or infinite
///
/// Zero weights are legal and exclude the option at that decision; only cells
/// that cannot be interpreted as a relative priority end up here.
class DegenerateWeight : public InvalidConfiguration {
    std::size_t decision_;
    std::size_t option_;

  public:
    DegenerateWeight(std::size_t decision, std::size_t option, double weight)
        : InvalidConfiguration("Weight at decision " + std::to_string(decision) + ", option " +
                               std::to_string(option) + " must be finite and non-negative (got " +
                               std::to_string(weight) + ")"),
          decision_(decision), option_(option) {}

    std::size_t decision() const { return decision_; }
    std::size_t option() const { return option_; }
};

/// No option passed the acceptability predicate with a finite scheduling value
class NoAcceptableOption : public SelectorError {
    std::size_t decision_;

  public:
    explicit NoAcceptableOption(std::size_t decision)
        : SelectorError("No acceptable option at decision " + std::to_string(decision)),
          decision_(decision) {}

    std::size_t decision() const { return decision_; }
};

} // namespace statfeed::core
