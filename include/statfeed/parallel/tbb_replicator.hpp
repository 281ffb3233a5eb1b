#pragma once

#ifdef STATFEED_HAVE_TBB

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/partitioner.h>

namespace statfeed::parallel {

/// Outcome of one independent selector run
struct ReplicaResult {
    std::uint64_t seed = 0;
    std::vector<std::size_t> chosen_indices;
    std::vector<double> statistics;
};

/// Callable building a ready-to-run selector from a seed
template <typename F>
concept ReplicaFactory = requires(const F& factory, std::uint64_t seed) {
    { factory(seed).populate_choices() };
    { factory(seed).chosen_indices() } -> std::convertible_to<std::vector<std::size_t>>;
    { factory(seed).statistics() } -> std::convertible_to<std::vector<double>>;
};

/// Runs many independent selectors in parallel with Intel TBB
///
/// A single selector is inherently sequential: every decision reads the statistics
/// settled by the previous one. Studies of the algorithm (how fast shares converge,
/// how the statistics spread behaves for different heterogeneities) need many runs
/// with different random draws, and those runs share nothing. The replicator builds
/// replica r with seed `base_seed + r`, runs it on its own engine, and stores the result
/// at index r.
///
/// Deterministic Execution:
/// - Each replica owns its engine and random source, so results do not depend on the
///   thread a replica ran on
/// - static_partitioner keeps chunk boundaries identical across runs
/// - run() and run_sequential() return identical results for the same factory
///
/// Exception Safety:
/// An exception thrown while building or running a replica (for example
/// core::NoAcceptableOption) is propagated out of run(); no partial result is returned.
class TBBReplicator {
  public:
    TBBReplicator() = default;

    /// Run `replicas` independent selectors in parallel
    ///
    /// @warning `factory` is invoked concurrently from several threads and must only read
    ///          shared state.
    /// @param factory Builds a selector for a given seed
    /// @param replicas Number of independent runs
    /// @param base_seed Seed of replica 0; replica r uses `base_seed + r`
    /// @return Results in replica order
    template <ReplicaFactory F>
    [[nodiscard]] std::vector<ReplicaResult> run(const F& factory, std::size_t replicas,
                                                 std::uint64_t base_seed) const {
        if (replicas == 0) {
            return std::vector<ReplicaResult>{};
        }

        std::vector<ReplicaResult> results(replicas);

        tbb::parallel_for(
            tbb::blocked_range<std::size_t>(0, replicas),
            [&factory, &results, base_seed](const tbb::blocked_range<std::size_t>& range) {
                // Each index is written by exactly one task
                for (std::size_t r = range.begin(); r != range.end(); ++r) {
                    results[r] = run_replica(factory, base_seed + r);
                }
            },
            tbb::static_partitioner{});

        return results;
    }

    /// Sequential reference implementation of run()
    template <ReplicaFactory F>
    [[nodiscard]] static std::vector<ReplicaResult>
    run_sequential(const F& factory, std::size_t replicas, std::uint64_t base_seed) {
        std::vector<ReplicaResult> results;
        results.reserve(replicas);
        for (std::size_t r = 0; r < replicas; ++r) {
            results.push_back(run_replica(factory, base_seed + r));
        }
        return results;
    }

  private:
    template <ReplicaFactory F>
    static ReplicaResult run_replica(const F& factory, std::uint64_t seed) {
        auto selector = factory(seed);
        selector.populate_choices();

        ReplicaResult result;
        result.seed = seed;
        result.chosen_indices = selector.chosen_indices();
        result.statistics = selector.statistics();
        return result;
    }
};

} // namespace statfeed::parallel

#else

#error "\n" \
       "====================================================================\n" \
       " TBB (Threading Building Blocks) is required for parallel replica\n" \
       " runs but was not found during configuration.\n" \
       "\n" \
       " Resolution options:\n" \
       "   1. Install Intel TBB development package:\n" \
       "      - Ubuntu/Debian: apt install libtbb-dev\n" \
       "      - RHEL/CentOS:   yum install tbb-devel\n" \
       "      - macOS:         brew install tbb\n" \
       "\n" \
       "   2. Disable parallel replicas:\n" \
       "      cmake -DSTATFEED_USE_TBB=OFF .\n" \
       "===================================================================="

#endif // STATFEED_HAVE_TBB
