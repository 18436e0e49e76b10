#pragma once
// Permutation null model.
//
// Each trial relabels codons into a same-shaped partition and re-aggregates
// the full dataset. Trial i draws from a generator seeded by (seed, i), so
// the distribution depends only on the seed, never on thread count or
// scheduling order.

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

#include "fcaudit/fc_aggregate.hpp"
#include "fcaudit/fc_statistic.hpp"
#include "fcaudit/orbit_map.hpp"
#include "fcaudit/run_control.hpp"
#include "fcaudit/usage_table.hpp"

namespace fcaudit {

struct NullModelParams {
    uint32_t repetitions = 0;
    std::optional<uint64_t> seed;  // drawn from std::random_device when unset
    int num_threads = 0;           // 0 = OpenMP default
    CentralTendency central = CentralTendency::MEAN;
};

struct NullDistribution {
    // Central ratio per trial, in trial order. Trials whose permuted map left
    // no valid organism hold NaN.
    std::vector<double> samples;
    uint64_t seed = 0;
    uint32_t invalid_trials = 0;

    uint32_t repetitions() const { return static_cast<uint32_t>(samples.size()); }
};

// Called after each completed trial with (completed, total)
using TrialProgressFn = std::function<void(uint32_t completed, uint32_t total)>;

// Seed for trial `trial` derived from the run seed (splitmix64 mixing)
uint64_t trial_seed(uint64_t run_seed, uint32_t trial);

uint64_t resolve_seed(const std::optional<uint64_t>& requested);

/**
 * Build the null distribution of the central ratio
 *
 * Rethrows the first error raised by any trial after all threads join, and
 * throws RunCancelled if the token was set.
 */
NullDistribution sample_null_distribution(const RecordSource& data,
                                          const OrbitMap& original,
                                          const StatisticParams& stat_params,
                                          const NullModelParams& params,
                                          const TrialProgressFn& progress = TrialProgressFn(),
                                          const CancelToken* cancel = nullptr);

} // namespace fcaudit
