#pragma once

/// @file acceptance.hpp
/// @brief Acceptability predicates for the selector engine
///
/// Each predicate satisfies core::AcceptancePredicate and is handed to the selector
/// at construction. The selector only picks options the predicate accepts; if a
/// decision has no acceptable option the run fails with core::NoAcceptableOption.

#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

#include <statfeed/core/errors.hpp>

namespace statfeed::operators {

/// Accepts every option at every decision
struct AcceptAll {
    template <typename T>
    constexpr bool accepts(const T&, std::size_t, std::size_t) const {
        return true;
    }
};

/// Adapts any callable `bool(const T&, std::size_t option_index, std::size_t decision)`
///
/// ## Example Usage:
/// ```cpp
/// // Never pick "maintenance" during the first ten decisions
/// FunctionAcceptance<std::string> predicate(
///     [](const std::string& name, std::size_t, std::size_t decision) {
///         return !(name == "maintenance" && decision < 10);
///     });
/// ```
template <typename T>
class FunctionAcceptance {
  public:
    using Function = std::function<bool(const T&, std::size_t, std::size_t)>;

    explicit FunctionAcceptance(Function fn) : fn_(std::move(fn)) {
        if (!fn_) {
            throw core::InvalidConfiguration("FunctionAcceptance requires a callable");
        }
    }

    bool accepts(const T& option, std::size_t option_index, std::size_t decision) const {
        return fn_(option, option_index, decision);
    }

  private:
    Function fn_;
};

/// Availability table indexed as [decision][option]
///
/// Decisions beyond the table, or options beyond a row, are treated as available,
/// so a mask only needs to describe the decisions it restricts.
class AvailabilityMask {
    std::vector<std::vector<bool>> available_;

  public:
    AvailabilityMask() = default;
    explicit AvailabilityMask(std::vector<std::vector<bool>> available)
        : available_(std::move(available)) {}

    /// Mark `option` unavailable at `decision`, growing the table as needed
    void exclude(std::size_t decision, std::size_t option) {
        if (available_.size() <= decision) {
            available_.resize(decision + 1);
        }
        auto& row = available_[decision];
        if (row.size() <= option) {
            row.resize(option + 1, true);
        }
        row[option] = false;
    }

    bool is_available(std::size_t decision, std::size_t option) const {
        if (decision >= available_.size() || option >= available_[decision].size()) {
            return true;
        }
        return available_[decision][option];
    }

    template <typename T>
    bool accepts(const T&, std::size_t option_index, std::size_t decision) const {
        return is_available(decision, option_index);
    }
};

} // namespace statfeed::operators
