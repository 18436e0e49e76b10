#pragma once
// Per-organism compliance statistic: sigma_intra / sigma_inter
//
// Usage is normalized per organism (so sequencing depth cancels), then
// summarized per orbit: the mean and the population variance of member
// usage. sigma_inter is the spread of orbit means across orbits, sigma_intra
// the square root of the pooled orbit variances.

#include <array>
#include <cmath>
#include <cstdint>
#include <limits>

#include "fcaudit/codon_tables.hpp"
#include "fcaudit/orbit_map.hpp"
#include "fcaudit/usage_table.hpp"

namespace fcaudit {

enum class Normalization {
    PROPORTION,  // divide by total: values sum to 1
    MEAN         // divide by the organism's own mean: values average 1
};

// How orbits are weighted when combining per-orbit quantities
enum class OrbitWeighting {
    EQUAL,  // every orbit counts once
    SIZE    // orbits weighted by member count
};

struct StatisticParams {
    Normalization normalization = Normalization::PROPORTION;
    // Size weighting for both spreads equals taking the SD over all 64
    // codons, each carrying its orbit mean (inter) or its deviation (intra)
    OrbitWeighting inter_weighting = OrbitWeighting::SIZE;
    OrbitWeighting intra_weighting = OrbitWeighting::SIZE;
    // sigma_inter at or below this fraction of the grand mean counts as zero
    double degenerate_tolerance = 1e-12;
};

enum class ExclusionReason : uint8_t {
    NONE = 0,
    ZERO_USAGE,        // all-zero row, nothing to normalize
    ZERO_INTER_SPREAD  // all orbit means equal, ratio undefined
};

struct FcStatistic {
    double intra_spread = 0.0;
    double inter_spread = 0.0;
    double ratio = std::numeric_limits<double>::quiet_NaN();
    ExclusionReason exclusion = ExclusionReason::NONE;

    bool excluded() const { return exclusion != ExclusionReason::NONE; }
};

FcStatistic compute_ratio(const std::array<double, NUM_CODONS>& usage,
                          const OrbitMap& map,
                          const StatisticParams& params = StatisticParams());

inline FcStatistic compute_ratio(const OrganismRecord& record,
                                 const OrbitMap& map,
                                 const StatisticParams& params = StatisticParams()) {
    return compute_ratio(record.usage, map, params);
}

const char* exclusion_to_string(ExclusionReason reason);
const char* normalization_to_string(Normalization n);
const char* weighting_to_string(OrbitWeighting w);

} // namespace fcaudit
