// Permutation null model
//
// Trials run as an OpenMP parallel loop. Each trial owns one output slot, so
// no reduction is needed and the result is identical for any thread count.

#include "fcaudit/null_model.hpp"

#include <atomic>
#include <cmath>
#include <exception>
#include <limits>
#include <mutex>
#include <random>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace fcaudit {

uint64_t trial_seed(uint64_t run_seed, uint32_t trial) {
    uint64_t z = run_seed + 0x9E3779B97F4A7C15ULL * (static_cast<uint64_t>(trial) + 1);
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

uint64_t resolve_seed(const std::optional<uint64_t>& requested) {
    if (requested) return *requested;
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd());
}

NullDistribution sample_null_distribution(const RecordSource& data,
                                          const OrbitMap& original,
                                          const StatisticParams& stat_params,
                                          const NullModelParams& params,
                                          const TrialProgressFn& progress,
                                          const CancelToken* cancel) {
    NullDistribution dist;
    dist.seed = resolve_seed(params.seed);
    const uint32_t R = params.repetitions;
    dist.samples.assign(R, std::numeric_limits<double>::quiet_NaN());
    if (R == 0) return dist;

    AggregateOptions agg_opts;
    agg_opts.central = params.central;
    agg_opts.progress_interval = 0;
    agg_opts.cancel = cancel;

    std::exception_ptr first_error = nullptr;
    std::mutex error_mutex;
    std::mutex progress_mutex;
    std::atomic<bool> stop{false};
    std::atomic<uint32_t> completed{0};

    int num_threads = 1;
#ifdef _OPENMP
    num_threads = params.num_threads > 0 ? params.num_threads : omp_get_max_threads();
#endif
    (void)num_threads;

    const int64_t n_trials = static_cast<int64_t>(R);

    #pragma omp parallel for schedule(dynamic, 1) num_threads(num_threads)
    for (int64_t t = 0; t < n_trials; ++t) {
        if (stop.load(std::memory_order_relaxed)) continue;
        if (cancel && cancel->requested()) {
            stop.store(true, std::memory_order_relaxed);
            continue;
        }
        try {
            const uint32_t trial = static_cast<uint32_t>(t);
            std::mt19937_64 rng(trial_seed(dist.seed, trial));
            const OrbitMap permuted = permute_orbits(original, rng);
            const AggregateResult agg = aggregate_source(data, permuted, stat_params, agg_opts);
            dist.samples[static_cast<size_t>(t)] = agg.central_ratio;

            const uint32_t done = completed.fetch_add(1, std::memory_order_relaxed) + 1;
            if (progress) {
                std::lock_guard<std::mutex> lock(progress_mutex);
                progress(done, R);
            }
        } catch (...) {
            std::lock_guard<std::mutex> lock(error_mutex);
            if (!first_error) first_error = std::current_exception();
            stop.store(true, std::memory_order_relaxed);
        }
    }

    // Cancellation inside a trial surfaces as RunCancelled through first_error
    if (first_error) std::rethrow_exception(first_error);
    if (cancel) cancel->throw_if_requested();

    for (double s : dist.samples) {
        if (!std::isfinite(s)) ++dist.invalid_trials;
    }
    return dist;
}

} // namespace fcaudit
