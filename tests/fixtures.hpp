// Shared test fixtures: the standard genetic code as an orbit map, synthetic
// codon usage, and scratch files.

#pragma once

#include "fcaudit/codon_tables.hpp"
#include "fcaudit/orbit_map.hpp"
#include "fcaudit/usage_table.hpp"

#include <array>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

namespace fixtures {

// Amino acid per codon in canonical (UCAG) order
constexpr const char* STANDARD_CODE =
    "FFLLSSSSYY**CC*WLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG";

inline void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

inline std::array<fcaudit::OrbitMap::OrbitId, fcaudit::NUM_CODONS> standard_assignment() {
    std::array<fcaudit::OrbitMap::OrbitId, fcaudit::NUM_CODONS> a{};
    for (int c = 0; c < fcaudit::NUM_CODONS; ++c) {
        a[static_cast<size_t>(c)] = static_cast<unsigned char>(STANDARD_CODE[c]);
    }
    return a;
}

inline fcaudit::OrbitMap standard_map() {
    return fcaudit::OrbitMap(standard_assignment(), "standard");
}

// Orbit map file text: optional header, DNA spelling, `delim` separated
inline std::string map_text(const fcaudit::OrbitMap& map, bool header = true, char delim = '\t') {
    std::ostringstream os;
    if (header) os << "codon" << delim << "orbit\n";
    for (int c = 0; c < fcaudit::NUM_CODONS; ++c) {
        std::string name = fcaudit::codon_name(c);
        for (char& ch : name) {
            if (ch == 'U') ch = 'T';
        }
        os << name << delim << map.orbit_of(c) << "\n";
    }
    return os.str();
}

/**
 * Usage that follows the map: every member of an orbit is drawn around one
 * orbit-level rate, with relative jitter `noise`. noise = 0 gives an exactly
 * compliant organism.
 */
inline fcaudit::OrganismRecord synthetic_organism(const fcaudit::OrbitMap& map,
                                                  std::mt19937_64& rng,
                                                  double noise,
                                                  const std::string& id) {
    std::uniform_real_distribution<double> level(20.0, 400.0);
    std::uniform_real_distribution<double> jitter(1.0 - noise, 1.0 + noise);
    fcaudit::OrganismRecord rec;
    rec.id = id;
    for (const auto& members : map.members()) {
        const double rate = level(rng);
        for (uint8_t c : members) {
            rec.usage[c] = noise > 0.0 ? rate * jitter(rng) : rate;
        }
    }
    return rec;
}

inline std::vector<fcaudit::OrganismRecord> synthetic_dataset(const fcaudit::OrbitMap& map,
                                                              size_t n, double noise,
                                                              uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::vector<fcaudit::OrganismRecord> out;
    for (size_t i = 0; i < n; ++i) {
        out.push_back(synthetic_organism(map, rng, noise, "org" + std::to_string(i + 1)));
    }
    return out;
}

inline fcaudit::OrganismRecord uniform_organism(const std::string& id, double value = 5.0) {
    fcaudit::OrganismRecord rec;
    rec.id = id;
    rec.usage.fill(value);
    return rec;
}

// Tab-separated usage table: id, `metadata` columns, codons in `order`
inline std::string table_text(const std::vector<fcaudit::OrganismRecord>& records,
                              const std::vector<std::string>& metadata = {},
                              const std::vector<int>& order = {}) {
    std::vector<int> cols = order;
    if (cols.empty()) {
        for (int c = 0; c < fcaudit::NUM_CODONS; ++c) cols.push_back(c);
    }
    std::ostringstream os;
    os.precision(17);
    os << "organism";
    for (const auto& m : metadata) os << '\t' << m;
    for (int c : cols) os << '\t' << fcaudit::codon_name(c);
    os << '\n';
    for (const auto& r : records) {
        os << r.id;
        for (size_t m = 0; m < metadata.size(); ++m) os << "\tmeta" << m;
        for (int c : cols) os << '\t' << r.usage[static_cast<size_t>(c)];
        os << '\n';
    }
    return os.str();
}

inline void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    out << content;
}

inline std::string read_file(const std::string& path) {
    std::ifstream in(path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

inline std::string make_tmpdir(const char* tag) {
    std::string tmpl = (std::filesystem::temp_directory_path() /
                        (std::string("fcaudit_") + tag + "_XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    char* dir = mkdtemp(buf.data());
    if (!dir) {
        std::cerr << "Failed to create temp dir\n";
        std::exit(2);
    }
    return dir;
}

}  // namespace fixtures
