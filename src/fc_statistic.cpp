#include "fcaudit/fc_statistic.hpp"

#include <vector>

namespace fcaudit {

FcStatistic compute_ratio(const std::array<double, NUM_CODONS>& usage,
                          const OrbitMap& map,
                          const StatisticParams& params) {
    FcStatistic stat;

    double total = 0.0;
    for (double v : usage) total += v;
    if (!(total > 0.0)) {
        stat.exclusion = ExclusionReason::ZERO_USAGE;
        return stat;
    }

    const double scale = (params.normalization == Normalization::MEAN)
        ? static_cast<double>(NUM_CODONS) / total
        : 1.0 / total;

    std::array<double, NUM_CODONS> x;
    for (int c = 0; c < NUM_CODONS; ++c) {
        x[static_cast<size_t>(c)] = usage[static_cast<size_t>(c)] * scale;
    }

    const auto& members = map.members();
    const size_t K = members.size();

    // Per-orbit mean and population variance (two-pass, zero for singletons
    // and for orbits whose members are all equal)
    thread_local std::vector<double> orbit_mean;
    thread_local std::vector<double> orbit_var;
    orbit_mean.resize(K);
    orbit_var.resize(K);

    for (size_t k = 0; k < K; ++k) {
        const auto& m = members[k];
        const double n = static_cast<double>(m.size());
        double sum = 0.0;
        bool uniform = true;
        for (uint8_t c : m) {
            sum += x[c];
            uniform = uniform && x[c] == x[m.front()];
        }
        // Equal members have no spread; sum/n would leave rounding residue
        const double mean = uniform ? x[m.front()] : sum / n;
        double ss = 0.0;
        if (!uniform) {
            for (uint8_t c : m) {
                const double d = x[c] - mean;
                ss += d * d;
            }
        }
        orbit_mean[k] = mean;
        orbit_var[k] = ss / n;
    }

    // sigma_inter: spread of orbit means
    double w_sum = 0.0;
    double grand = 0.0;
    for (size_t k = 0; k < K; ++k) {
        const double w = (params.inter_weighting == OrbitWeighting::SIZE)
            ? static_cast<double>(members[k].size()) : 1.0;
        w_sum += w;
        grand += w * orbit_mean[k];
    }
    grand /= w_sum;

    double inter_ss = 0.0;
    for (size_t k = 0; k < K; ++k) {
        const double w = (params.inter_weighting == OrbitWeighting::SIZE)
            ? static_cast<double>(members[k].size()) : 1.0;
        const double d = orbit_mean[k] - grand;
        inter_ss += w * d * d;
    }
    stat.inter_spread = std::sqrt(inter_ss / w_sum);

    // sigma_intra: pooled orbit variance
    double v_wsum = 0.0;
    double pooled = 0.0;
    for (size_t k = 0; k < K; ++k) {
        const double w = (params.intra_weighting == OrbitWeighting::SIZE)
            ? static_cast<double>(members[k].size()) : 1.0;
        v_wsum += w;
        pooled += w * orbit_var[k];
    }
    stat.intra_spread = std::sqrt(pooled / v_wsum);

    if (stat.inter_spread <= params.degenerate_tolerance * std::abs(grand)) {
        stat.exclusion = ExclusionReason::ZERO_INTER_SPREAD;
        return stat;
    }

    stat.ratio = stat.intra_spread / stat.inter_spread;
    return stat;
}

const char* exclusion_to_string(ExclusionReason reason) {
    switch (reason) {
        case ExclusionReason::ZERO_USAGE: return "zero_usage";
        case ExclusionReason::ZERO_INTER_SPREAD: return "zero_inter_spread";
        default: return "ok";
    }
}

const char* normalization_to_string(Normalization n) {
    switch (n) {
        case Normalization::MEAN: return "mean";
        default: return "proportion";
    }
}

const char* weighting_to_string(OrbitWeighting w) {
    switch (w) {
        case OrbitWeighting::SIZE: return "size";
        default: return "equal";
    }
}

} // namespace fcaudit
