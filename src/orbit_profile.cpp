#include "fcaudit/orbit_profile.hpp"
#include "fcaudit/fc_aggregate.hpp"
#include "fcaudit/report.hpp"

#include <cmath>
#include <limits>
#include <ostream>

namespace fcaudit {

double within_orbit_cv(const std::array<double, NUM_CODONS>& usage,
                       const std::vector<uint8_t>& members) {
    const size_t n = members.size();
    if (n < 2) return std::numeric_limits<double>::quiet_NaN();

    double total = 0.0;
    bool uniform = true;
    for (uint8_t c : members) {
        total += usage[c];
        uniform = uniform && usage[c] == usage[members.front()];
    }
    if (total <= 0.0) return std::numeric_limits<double>::quiet_NaN();
    if (uniform) return 0.0;

    // Frequencies sum to 1, so their mean is 1/n
    const double mean = 1.0 / static_cast<double>(n);
    double ss = 0.0;
    for (uint8_t c : members) {
        const double d = usage[c] / total - mean;
        ss += d * d;
    }
    return std::sqrt(ss / static_cast<double>(n - 1)) / mean;
}

std::vector<OrbitProfileRow> profile_orbits(const RecordSource& source,
                                            const OrbitMap& map,
                                            const CancelToken* cancel) {
    const auto& members = map.members();
    std::vector<size_t> profiled;
    for (size_t k = 0; k < members.size(); ++k) {
        if (members[k].size() >= 2) profiled.push_back(k);
    }

    std::vector<std::vector<double>> cvs(profiled.size());
    auto cursor = source.open();
    OrganismRecord rec;
    while (cursor->next(rec)) {
        if (cancel) cancel->throw_if_requested();
        for (size_t i = 0; i < profiled.size(); ++i) {
            const double cv = within_orbit_cv(rec.usage, members[profiled[i]]);
            if (std::isfinite(cv)) cvs[i].push_back(cv);
        }
    }

    std::vector<OrbitProfileRow> rows;
    rows.reserve(profiled.size());
    for (size_t i = 0; i < profiled.size(); ++i) {
        const size_t k = profiled[i];
        RunningStats st;
        for (double v : cvs[i]) st.add(v);

        OrbitProfileRow row;
        row.orbit = map.orbit_ids()[k];
        row.size = members[k].size();
        row.organisms = st.count;
        row.mean_cv = st.mean();
        row.sd_cv = st.sd();
        row.median_cv = median_of(std::move(cvs[i]));
        rows.push_back(row);
    }
    return rows;
}

void write_orbit_profile(std::ostream& out, const std::vector<OrbitProfileRow>& rows) {
    out << "orbit\tsize\torganisms\tmedian_cv\tmean_cv\tsd_cv\n";
    for (const auto& r : rows) {
        out << r.orbit << '\t' << r.size << '\t' << r.organisms << '\t'
            << format_number(r.median_cv) << '\t'
            << format_number(r.mean_cv) << '\t'
            << format_number(r.sd_cv) << '\n';
    }
}

} // namespace fcaudit
