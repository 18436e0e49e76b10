#pragma once
// Orbit map: total function codon -> orbit id, and the partition it induces.
//
// OrbitMap is an immutable value. Permutations produce new maps with the
// same multiset of orbit sizes; the original is never touched.

#include <array>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <random>
#include <string>
#include <vector>

#include "fcaudit/codon_tables.hpp"

namespace fcaudit {

class OrbitMap {
public:
    using OrbitId = int64_t;

    // Builds the partition from a complete assignment in canonical codon
    // order. Every codon is assigned by construction, so members are disjoint
    // and cover the domain.
    explicit OrbitMap(const std::array<OrbitId, NUM_CODONS>& assignment,
                      std::string source = std::string());

    OrbitId orbit_of(int codon) const { return assignment_[static_cast<size_t>(codon)]; }

    // Dense orbit index (position in orbit_ids()) for a codon
    uint32_t orbit_index(int codon) const { return dense_[static_cast<size_t>(codon)]; }

    size_t num_orbits() const { return ids_.size(); }

    // Orbit ids in ascending order
    const std::vector<OrbitId>& orbit_ids() const { return ids_; }

    // Member codon indices per dense orbit index, ascending
    const std::vector<std::vector<uint8_t>>& members() const { return members_; }

    size_t orbit_size(size_t orbit) const { return members_[orbit].size(); }

    // Sorted multiset of orbit sizes (the partition's shape)
    std::vector<size_t> size_profile() const;

    const std::array<OrbitId, NUM_CODONS>& assignment() const { return assignment_; }

    const std::string& source() const { return source_; }

    bool same_assignment(const OrbitMap& other) const {
        return assignment_ == other.assignment_;
    }

private:
    std::array<OrbitId, NUM_CODONS> assignment_;
    std::array<uint32_t, NUM_CODONS> dense_{};
    std::vector<OrbitId> ids_;
    std::vector<std::vector<uint8_t>> members_;
    std::string source_;
};

/**
 * Parse a delimited orbit map (codon, orbit id) with an optional header.
 *
 * Throws FormatError when the number of data rows is not 64, a codon is
 * unknown or duplicated, or an orbit id cannot be parsed.
 */
OrbitMap parse_orbit_map(std::istream& in, const std::string& source_name);

// Same, reading a plain or gzip-compressed file
OrbitMap load_orbit_map(const std::string& path);

/**
 * Relabel codons uniformly at random into a partition of the same shape.
 *
 * The codon -> orbit assignment is shuffled, so the orbit-size multiset is
 * preserved exactly. With more than one orbit, a draw identical to the input
 * is rejected and redrawn.
 */
OrbitMap permute_orbits(const OrbitMap& base, std::mt19937_64& rng);

} // namespace fcaudit
