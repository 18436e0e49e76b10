#include "fcaudit/fc_aggregate.hpp"

#include <algorithm>
#include <cstddef>

namespace fcaudit {

const char* central_to_string(CentralTendency c) {
    switch (c) {
        case CentralTendency::MEDIAN: return "median";
        default: return "mean";
    }
}

double median_of(std::vector<double> values) {
    if (values.empty()) return std::numeric_limits<double>::quiet_NaN();
    const size_t n = values.size();
    const size_t mid = n / 2;
    std::nth_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid), values.end());
    const double upper = values[mid];
    if (n % 2 == 1) return upper;
    const double lower = *std::max_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid));
    return 0.5 * (lower + upper);
}

void FcAggregator::add(const FcStatistic& stat) {
    ++processed_;
    switch (stat.exclusion) {
        case ExclusionReason::ZERO_USAGE:
            ++zero_usage_;
            return;
        case ExclusionReason::ZERO_INTER_SPREAD:
            ++zero_inter_;
            return;
        default:
            break;
    }
    ratios_.add(stat.ratio);
    if (central_ == CentralTendency::MEDIAN) kept_.push_back(stat.ratio);
}

AggregateResult FcAggregator::result() const {
    AggregateResult r;
    r.records_processed = processed_;
    r.sample_size = ratios_.count;
    r.zero_usage = zero_usage_;
    r.zero_inter_spread = zero_inter_;
    r.excluded_count = zero_usage_ + zero_inter_;
    if (ratios_.count == 0) return r;

    r.mean_ratio = ratios_.mean();
    r.sd_ratio = ratios_.sd();
    r.central_ratio = (central_ == CentralTendency::MEDIAN) ? median_of(kept_) : r.mean_ratio;
    return r;
}

AggregateResult aggregate_source(const RecordSource& source,
                                 const OrbitMap& map,
                                 const StatisticParams& params,
                                 const AggregateOptions& options) {
    FcAggregator agg(options.central);
    auto cursor = source.open();
    OrganismRecord rec;

    while (cursor->next(rec)) {
        if (options.cancel) options.cancel->throw_if_requested();

        const FcStatistic stat = compute_ratio(rec, map, params);
        agg.add(stat);
        if (options.observer) options.observer(rec, stat);

        if (options.progress && options.progress_interval > 0 &&
            agg.processed() % options.progress_interval == 0) {
            options.progress(agg.processed());
        }
    }
    return agg.result();
}

} // namespace fcaudit
