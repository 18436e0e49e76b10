#include "fcaudit/significance.hpp"
#include "fcaudit/errors.hpp"
#include "fcaudit/fc_aggregate.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace fcaudit {

SignificanceReport assess_significance(double observed, const NullDistribution& null) {
    if (!std::isfinite(observed)) {
        throw std::invalid_argument("assess_significance: observed ratio is not finite");
    }

    RunningStats acc;
    uint64_t at_or_below = 0;
    for (double s : null.samples) {
        if (!std::isfinite(s)) continue;
        acc.add(s);
        if (s <= observed) ++at_or_below;
    }

    if (acc.count == 0) {
        throw DegenerateNullError("no valid null samples out of " +
                                  std::to_string(null.repetitions()) + " trials");
    }
    const double sd = acc.sd();
    if (!(sd > 0.0)) {
        throw DegenerateNullError("null distribution has zero variance over " +
                                  std::to_string(acc.count) + " trials");
    }

    SignificanceReport rep;
    rep.observed_ratio = observed;
    rep.null_mean = acc.mean();
    rep.null_sd = sd;
    rep.null_se = sd / std::sqrt(static_cast<double>(acc.count));
    rep.z = (observed - rep.null_mean) / sd;
    rep.null_at_or_below = at_or_below;
    rep.p_value = static_cast<double>(at_or_below + 1) / static_cast<double>(acc.count + 1);
    rep.repetitions = null.repetitions();
    rep.valid_trials = static_cast<uint32_t>(acc.count);
    rep.seed = null.seed;
    return rep;
}

} // namespace fcaudit
