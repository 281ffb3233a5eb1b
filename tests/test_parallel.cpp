#include <cstdint>
#include <exception>
#include <format>
#include <iostream>
#include <random>
#include <vector>

#include <statfeed/parallel/tbb_replicator.hpp>
#include <statfeed/statfeed.hpp>

#include "test_helper.hpp"

using statfeed::core::Matrix;
using statfeed::core::NoAcceptableOption;
using statfeed::core::Selector;
using statfeed::parallel::ReplicaResult;
using statfeed::parallel::TBBReplicator;

namespace {

// Weighted selector over five options; only the perturbation draws depend on the seed
Selector<int> make_weighted_selector(std::uint64_t seed) {
    auto selector = statfeed::factory::make_selector<int>({0, 1, 2, 3, 4}, 300, seed);
    selector.set_weights(Matrix(300, std::vector<double>{0.4, 0.25, 0.15, 0.15, 0.05}));
    return selector;
}

bool same_results(const std::vector<ReplicaResult>& a, const std::vector<ReplicaResult>& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (a[i].seed != b[i].seed || a[i].chosen_indices != b[i].chosen_indices ||
            a[i].statistics != b[i].statistics) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

static bool test_parallel_matches_sequential() {
    TestResult result;

    const TBBReplicator replicator;
    const auto parallel = replicator.run(make_weighted_selector, 32, 1000);
    const auto sequential = TBBReplicator::run_sequential(make_weighted_selector, 32, 1000);

    result.assert_eq(std::size_t{32}, parallel.size(), "One result per replica");
    result.assert_true(same_results(parallel, sequential),
                       "Parallel and sequential replicas are identical");

    for (std::size_t r = 0; r < parallel.size(); ++r) {
        result.assert_true(parallel[r].seed == 1000 + r,
                           std::format("Replica {} ran with seed {}", r, 1000 + r));
    }

    // Replicas must actually differ, otherwise the seeds are not reaching the engines
    result.assert_true(parallel[0].chosen_indices != parallel[1].chosen_indices,
                       "Different seeds give different runs");

    result.summary();
    return result.all_passed();
}

static bool test_replica_reproducibility() {
    TestResult result;

    const TBBReplicator replicator;
    const auto first = replicator.run(make_weighted_selector, 16, 7);
    const auto second = replicator.run(make_weighted_selector, 16, 7);
    result.assert_true(same_results(first, second), "Repeated parallel runs are identical");

    auto single = make_weighted_selector(7 + 3);
    single.populate_choices();
    result.assert_true(single.chosen_indices() == first[3].chosen_indices,
                       "Replica r equals a standalone run with seed base + r");

    for (const auto& replica : first) {
        const auto report = statfeed::analysis::analyze_fairness(
            replica.chosen_indices, Matrix(300, std::vector<double>{0.4, 0.25, 0.15, 0.15, 0.05}),
            5);
        result.assert_lt(report.max_abs_deviation, 5.0,
                         std::format("Replica seeded {} tracks its weights", replica.seed));
    }

    result.summary();
    return result.all_passed();
}

static bool test_edge_cases() {
    TestResult result;

    const TBBReplicator replicator;
    result.assert_true(replicator.run(make_weighted_selector, 0, 1).empty(),
                       "Zero replicas give no results");

    const auto failing = [](std::uint64_t seed) {
        auto selector = statfeed::factory::make_selector<int>({1, 2}, 10, seed);
        Matrix weights(10, std::vector<double>{0.5, 0.5});
        weights[seed % 10] = {0.0, 0.0};
        selector.set_weights(weights);
        return selector;
    };
    result.assert_throws<NoAcceptableOption>([&] { (void)replicator.run(failing, 8, 0); },
                                             "Replica failure propagates out of run()");

    result.summary();
    return result.all_passed();
}

int main() {
    std::cout << "Running Statfeed Parallel Replica Tests" << std::endl;
    std::cout << "=======================================" << std::endl;
    std::cout << std::endl;

    bool all_tests_passed = true;

    try {
        all_tests_passed &= test_parallel_matches_sequential();
        std::cout << std::endl;

        all_tests_passed &= test_replica_reproducibility();
        std::cout << std::endl;

        all_tests_passed &= test_edge_cases();
        std::cout << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "=======================================" << std::endl;
    std::cout << "Parallel replica tests completed." << std::endl;

    return all_tests_passed ? 0 : 1;
}
