/**
 * @file cmd_inspect_map.cpp
 * @brief Validate an orbit map and print its partition.
 */

#include "subcommand.hpp"
#include "fcaudit/codon_tables.hpp"
#include "fcaudit/orbit_map.hpp"

#include <iostream>
#include <string>

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: fcaudit " << prog << " <orbits.tsv> [options]\n\n"
              << "Load and validate an orbit map, then list each orbit's members.\n\n"
              << "Options:\n"
              << "  --tsv            One row per codon: codon, orbit, orbit_size\n"
              << "  -h, --help       Show this help message\n";
}

void print_orbits(const fcaudit::OrbitMap& map, std::ostream& os) {
    const auto& ids = map.orbit_ids();
    const auto& members = map.members();
    os << "Orbit map: " << map.source() << "\n";
    os << "Orbits:    " << map.num_orbits() << "\n";
    os << "Profile:  ";
    for (size_t s : map.size_profile()) os << " " << s;
    os << "\n\n";
    for (size_t k = 0; k < ids.size(); ++k) {
        os << "  " << ids[k] << "\t(" << members[k].size() << ")\t";
        for (size_t j = 0; j < members[k].size(); ++j) {
            if (j) os << ' ';
            os << fcaudit::codon_name(members[k][j]);
        }
        os << "\n";
    }
}

void print_tsv(const fcaudit::OrbitMap& map, std::ostream& os) {
    os << "codon\torbit\torbit_size\n";
    for (int c = 0; c < fcaudit::NUM_CODONS; ++c) {
        os << fcaudit::codon_name(c) << '\t' << map.orbit_of(c) << '\t'
           << map.orbit_size(map.orbit_index(c)) << '\n';
    }
}

}  // namespace

namespace fcaudit {
namespace cli {

int cmd_inspect_map(int argc, char* argv[]) {
    std::string map_file;
    bool tsv = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--tsv") {
            tsv = true;
        } else if (arg[0] != '-' && map_file.empty()) {
            map_file = arg;
        } else {
            std::cerr << "Error: Unexpected argument: " << arg << "\n\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (map_file.empty()) {
        std::cerr << "Error: Orbit map file required\n\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        const OrbitMap map = load_orbit_map(map_file);
        tsv ? print_tsv(map, std::cout) : print_orbits(map, std::cout);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

}  // namespace cli
}  // namespace fcaudit

namespace {
    struct InspectMapRegistrar {
        InspectMapRegistrar() {
            fcaudit::cli::SubcommandRegistry::instance().register_command(
                "inspect-map",
                "Validate an orbit map and print its partition",
                fcaudit::cli::cmd_inspect_map, 30);
        }
    };
    static InspectMapRegistrar registrar;
}
