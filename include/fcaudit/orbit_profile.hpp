#pragma once
// Within-orbit heterogeneity per orbit, across organisms

#include <array>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <vector>

#include "fcaudit/orbit_map.hpp"
#include "fcaudit/run_control.hpp"
#include "fcaudit/usage_table.hpp"

namespace fcaudit {

struct OrbitProfileRow {
    OrbitMap::OrbitId orbit = 0;
    size_t size = 0;
    uint64_t organisms = 0;   // organisms with a nonzero orbit total
    double median_cv = 0.0;
    double mean_cv = 0.0;
    double sd_cv = 0.0;       // population SD across organisms
};

/**
 * Coefficient of variation of one organism's frequencies inside an orbit.
 *
 * Member counts are rescaled to the orbit total; CV is the sample SD
 * (divisor n-1) over the mean. NaN for singleton orbits or a zero total.
 */
double within_orbit_cv(const std::array<double, NUM_CODONS>& usage,
                       const std::vector<uint8_t>& members);

/**
 * One row per orbit with at least two members, in ascending orbit id order.
 * Orbits where no organism has usage report zero organisms and NaN summaries.
 */
std::vector<OrbitProfileRow> profile_orbits(const RecordSource& source,
                                            const OrbitMap& map,
                                            const CancelToken* cancel = nullptr);

// Columns: orbit, size, organisms, median_cv, mean_cv, sd_cv
void write_orbit_profile(std::ostream& out, const std::vector<OrbitProfileRow>& rows);

} // namespace fcaudit
