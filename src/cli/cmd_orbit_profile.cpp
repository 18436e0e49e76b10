// fcaudit orbit-profile: within-orbit heterogeneity per orbit
//
// For every multi-codon orbit, the coefficient of variation of each
// organism's within-orbit frequencies, summarized across organisms. High
// median CV marks orbits whose members are used unevenly.

#include "subcommand.hpp"
#include "fcaudit/log_utils.hpp"
#include "fcaudit/orbit_profile.hpp"
#include "fcaudit/report.hpp"
#include "fcaudit/run_control.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

namespace fcaudit {
namespace cli {

int cmd_orbit_profile(int argc, char* argv[]) {
    std::string map_file;
    std::vector<std::string> tables;
    std::string output_file;
    bool quiet = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--map" && i + 1 < argc) {
            map_file = argv[++i];
        } else if ((arg == "-i" || arg == "--input") && i + 1 < argc) {
            tables.push_back(argv[++i]);
        } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            output_file = argv[++i];
        } else if (arg == "-q" || arg == "--quiet") {
            quiet = true;
        } else if (arg == "-h" || arg == "--help") {
            std::cerr << "Usage: fcaudit orbit-profile --map <orbits.tsv> <usage.tsv[.gz]>... [options]\n\n";
            std::cerr << "Per-orbit coefficient of variation of within-orbit codon frequencies.\n";
            std::cerr << "Keeps one CV per organism per orbit in memory for the median.\n\n";
            std::cerr << "Required:\n";
            std::cerr << "  --map <file>           Orbit map (codon, orbit id)\n";
            std::cerr << "  -i, --input <file>     Codon usage table (repeatable; or positional)\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  -o, --output <file>    Write TSV to file (default: stdout)\n";
            std::cerr << "  -q, --quiet            No narration\n";
            std::cerr << "  -h, --help             Show this help\n";
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            return 1;
        } else {
            tables.push_back(arg);
        }
    }

    if (map_file.empty() || tables.empty()) {
        std::cerr << "Error: --map and at least one usage table are required\n";
        std::cerr << "Run 'fcaudit orbit-profile --help' for usage information.\n";
        return 1;
    }

    install_interrupt_handlers();
    auto start = std::chrono::steady_clock::now();

    try {
        const OrbitMap map = load_orbit_map(map_file);
        UsageTableSource source(tables, map);
        if (!quiet) std::cerr << "Profiling " << map.num_orbits() << " orbits over " << source.describe() << "\n";

        const auto rows = profile_orbits(source, map, &process_cancel_token());

        if (output_file.empty()) {
            write_orbit_profile(std::cout, rows);
        } else {
            AtomicFileWriter out(output_file);
            write_orbit_profile(out.stream(), rows);
            out.commit();
            if (!quiet) std::cerr << "Wrote " << output_file << "\n";
        }
    } catch (const RunCancelled&) {
        std::cerr << "Interrupted; no results written\n";
        return 130;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (!quiet) {
        std::cerr << "Runtime: "
                  << log_utils::format_elapsed(start, std::chrono::steady_clock::now()) << "\n";
    }
    return 0;
}

}  // namespace cli
}  // namespace fcaudit

namespace {
    struct OrbitProfileRegistrar {
        OrbitProfileRegistrar() {
            fcaudit::cli::SubcommandRegistry::instance().register_command(
                "orbit-profile",
                "Within-orbit codon usage heterogeneity per orbit",
                fcaudit::cli::cmd_orbit_profile, 20);
        }
    };
    static OrbitProfileRegistrar registrar;
}
