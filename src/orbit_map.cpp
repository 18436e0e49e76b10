#include "fcaudit/orbit_map.hpp"
#include "fcaudit/errors.hpp"
#include "fcaudit/fast_tsv.hpp"
#include "fcaudit/gz_line_reader.hpp"

#include <algorithm>
#include <istream>
#include <string_view>
#include <utility>

namespace fcaudit {

OrbitMap::OrbitMap(const std::array<OrbitId, NUM_CODONS>& assignment, std::string source)
    : assignment_(assignment), source_(std::move(source)) {
    ids_.assign(assignment_.begin(), assignment_.end());
    std::sort(ids_.begin(), ids_.end());
    ids_.erase(std::unique(ids_.begin(), ids_.end()), ids_.end());

    members_.assign(ids_.size(), {});
    for (int c = 0; c < NUM_CODONS; ++c) {
        auto it = std::lower_bound(ids_.begin(), ids_.end(), assignment_[static_cast<size_t>(c)]);
        const uint32_t k = static_cast<uint32_t>(it - ids_.begin());
        dense_[static_cast<size_t>(c)] = k;
        members_[k].push_back(static_cast<uint8_t>(c));
    }
}

std::vector<size_t> OrbitMap::size_profile() const {
    std::vector<size_t> sizes;
    sizes.reserve(members_.size());
    for (const auto& m : members_) sizes.push_back(m.size());
    std::sort(sizes.begin(), sizes.end());
    return sizes;
}

namespace {

// Comma, tab or blank separated; whichever the row uses
void split_map_row(std::string_view line, std::vector<std::string_view>& fields) {
    if (line.find('\t') != std::string_view::npos) {
        split_fields(line, '\t', fields);
    } else if (line.find(',') != std::string_view::npos) {
        split_fields(line, ',', fields);
    } else {
        split_whitespace(line, fields);
    }
    for (auto& f : fields) f = trim(f);
}

template <typename NextLine>
OrbitMap parse_map_lines(NextLine&& next_line, const std::string& source) {
    std::array<OrbitMap::OrbitId, NUM_CODONS> assignment{};
    std::array<size_t, NUM_CODONS> seen_at{};  // line of first occurrence, 0 = unseen
    std::vector<std::string_view> fields;
    std::string line;
    size_t line_no = 0;
    size_t data_rows = 0;
    bool first_row = true;

    while (next_line(line, line_no)) {
        if (is_blank_line(line)) continue;
        split_map_row(line, fields);

        if (first_row) {
            first_row = false;
            if (!is_codon_symbol(fields[0])) continue;  // header row
        }

        ++data_rows;
        if (data_rows > static_cast<size_t>(NUM_CODONS)) {
            throw FormatError(source, line_no, "",
                              "orbit map has more than 64 codon rows");
        }
        if (fields.size() != 2) {
            throw FormatError(source, line_no, fields.size() < 2 ? "orbit" : "",
                              "expected 2 fields (codon, orbit id), found " +
                              std::to_string(fields.size()));
        }

        const int codon = codon_to_idx(fields[0]);
        if (codon < 0) {
            throw FormatError(source, line_no, "codon",
                              "unrecognized codon symbol '" + std::string(fields[0]) + "'");
        }
        if (seen_at[static_cast<size_t>(codon)] != 0) {
            throw FormatError(source, line_no, "codon",
                              "duplicate codon " + codon_name(codon) + " (first seen on row " +
                              std::to_string(seen_at[static_cast<size_t>(codon)]) + ")");
        }

        int64_t orbit = 0;
        if (!parse_int64(fields[1], orbit)) {
            throw FormatError(source, line_no, "orbit",
                              "cannot parse orbit id '" + std::string(fields[1]) + "'");
        }

        seen_at[static_cast<size_t>(codon)] = line_no;
        assignment[static_cast<size_t>(codon)] = orbit;
    }

    if (data_rows != static_cast<size_t>(NUM_CODONS)) {
        throw FormatError(source, 0, "",
                          "expected 64 codon rows, found " + std::to_string(data_rows));
    }
    // 64 distinct valid codons means every codon is assigned
    return OrbitMap(assignment, source);
}

} // namespace

OrbitMap parse_orbit_map(std::istream& in, const std::string& source_name) {
    return parse_map_lines(
        [&in](std::string& line, size_t& line_no) {
            if (!std::getline(in, line)) return false;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            ++line_no;
            return true;
        },
        source_name);
}

OrbitMap load_orbit_map(const std::string& path) {
    GzLineReader reader(path);
    return parse_map_lines(
        [&reader](std::string& line, size_t& line_no) {
            if (!reader.readline(line)) return false;
            line_no = reader.line_number();
            return true;
        },
        path);
}

OrbitMap permute_orbits(const OrbitMap& base, std::mt19937_64& rng) {
    std::array<OrbitMap::OrbitId, NUM_CODONS> shuffled = base.assignment();
    if (base.num_orbits() < 2) {
        return OrbitMap(shuffled, base.source());
    }
    do {
        std::shuffle(shuffled.begin(), shuffled.end(), rng);
    } while (shuffled == base.assignment());
    return OrbitMap(shuffled, base.source());
}

} // namespace fcaudit
