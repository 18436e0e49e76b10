#pragma once

#include <cstdint>

#include "fcaudit/null_model.hpp"

namespace fcaudit {

struct SignificanceReport {
    double observed_ratio = 0.0;
    double null_mean = 0.0;
    double null_sd = 0.0;      // population SD of the finite null samples
    double null_se = 0.0;      // null_sd / sqrt(valid_trials)
    double z = 0.0;
    double p_value = 1.0;      // one-sided: null <= observed, add-one smoothed
    uint32_t repetitions = 0;  // R as requested
    uint32_t valid_trials = 0;
    uint64_t null_at_or_below = 0;
    uint64_t seed = 0;
};

/**
 * Locate the observed central ratio in the null distribution.
 *
 * Z = (observed - null_mean) / null_sd
 * p = (#{null <= observed} + 1) / (n + 1), lower ratios being better
 *
 * Throws DegenerateNullError when no finite null sample exists or the null
 * SD is zero; std::invalid_argument when `observed` is not finite.
 */
SignificanceReport assess_significance(double observed, const NullDistribution& null);

} // namespace fcaudit
