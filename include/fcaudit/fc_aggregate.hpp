#pragma once
// Single-pass aggregation of per-organism statistics over a dataset

#include <cmath>
#include <cstdint>
#include <functional>
#include <limits>
#include <vector>

#include "fcaudit/fc_statistic.hpp"
#include "fcaudit/orbit_map.hpp"
#include "fcaudit/run_control.hpp"
#include "fcaudit/usage_table.hpp"

namespace fcaudit {

/**
 * Online accumulator for mean and variance (Welford update, Chan merge)
 *
 * Partial accumulators merge exactly, so per-thread instances can be
 * combined at the end of a parallel region. A constant series keeps m2 at
 * exactly 0.
 */
struct RunningStats {
    uint64_t count = 0;
    double mean_ = 0.0;
    double m2 = 0.0;  // sum of squared deviations from the running mean

    void add(double x) {
        ++count;
        const double delta = x - mean_;
        mean_ += delta / static_cast<double>(count);
        m2 += delta * (x - mean_);
    }

    void merge(const RunningStats& o) {
        if (o.count == 0) return;
        if (count == 0) {
            *this = o;
            return;
        }
        const double n_a = static_cast<double>(count);
        const double n_b = static_cast<double>(o.count);
        const double n = n_a + n_b;
        const double delta = o.mean_ - mean_;
        mean_ += delta * n_b / n;
        m2 += o.m2 + delta * delta * n_a * n_b / n;
        count += o.count;
    }

    double mean() const {
        return count > 0 ? mean_ : std::numeric_limits<double>::quiet_NaN();
    }

    // Population variance (divisor n)
    double variance() const {
        if (count == 0) return std::numeric_limits<double>::quiet_NaN();
        return m2 > 0.0 ? m2 / static_cast<double>(count) : 0.0;
    }

    double sd() const { return std::sqrt(variance()); }
};

enum class CentralTendency { MEAN, MEDIAN };

const char* central_to_string(CentralTendency c);

// Median with the midpoint convention for even counts; NaN when empty
double median_of(std::vector<double> values);

struct AggregateResult {
    double central_ratio = std::numeric_limits<double>::quiet_NaN();
    uint64_t sample_size = 0;       // included organisms
    uint64_t excluded_count = 0;    // zero_usage + zero_inter_spread
    uint64_t records_processed = 0;
    uint64_t zero_usage = 0;
    uint64_t zero_inter_spread = 0;
    double mean_ratio = std::numeric_limits<double>::quiet_NaN();
    double sd_ratio = std::numeric_limits<double>::quiet_NaN();

    bool has_valid_organisms() const { return sample_size > 0; }
};

class FcAggregator {
public:
    explicit FcAggregator(CentralTendency central = CentralTendency::MEAN)
        : central_(central) {}

    void add(const FcStatistic& stat);

    uint64_t processed() const { return processed_; }

    AggregateResult result() const;

private:
    CentralTendency central_;
    RunningStats ratios_;
    std::vector<double> kept_;  // only for the median
    uint64_t processed_ = 0;
    uint64_t zero_usage_ = 0;
    uint64_t zero_inter_ = 0;
};

// Called every progress_interval records with the running record count
using ProgressFn = std::function<void(uint64_t records_processed)>;

// Called for every record with its statistic (e.g. to stream a ratio series)
using RecordObserver = std::function<void(const OrganismRecord&, const FcStatistic&)>;

struct AggregateOptions {
    CentralTendency central = CentralTendency::MEAN;
    uint64_t progress_interval = 1000;  // 0 disables progress callbacks
    ProgressFn progress;
    RecordObserver observer;
    const CancelToken* cancel = nullptr;
};

/**
 * Scan a dataset once, computing the statistic for every record under `map`
 *
 * Throws FormatError from the underlying reader and RunCancelled when the
 * token is set.
 */
AggregateResult aggregate_source(const RecordSource& source,
                                 const OrbitMap& map,
                                 const StatisticParams& params,
                                 const AggregateOptions& options = AggregateOptions());

} // namespace fcaudit
