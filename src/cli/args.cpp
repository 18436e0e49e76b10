#include "args.hpp"
#include "fcaudit/version.h"
#include <cstdint>
#include <iostream>
#include <string>

namespace fcaudit {
namespace cli {

void print_version() {
    std::cout << "fcaudit " << FCAUDIT_VERSION << "\n";
}

void print_usage(const char* program_name) {
    std::cout << "fcaudit v" << FCAUDIT_VERSION << "\n\n";
    std::cout << "Usage: " << program_name << " --map <orbits.tsv> <usage.tsv[.gz]>... [options]\n\n";
    std::cout << "Measures how well codon usage follows an orbit partition: per organism,\n";
    std::cout << "the ratio of within-orbit to between-orbit spread (lower = more compliant).\n\n";
    std::cout << "Required:\n";
    std::cout << "  --map <file>             Orbit map (codon, orbit id; 64 rows)\n";
    std::cout << "  -i, --input <file>       Codon usage table (repeatable; or positional)\n";
    std::cout << "\nStatistic:\n";
    std::cout << "  --normalize <mode>       proportion (default) or mean\n";
    std::cout << "  --inter-weight <mode>    Between-orbit spread: size (default) or equal\n";
    std::cout << "  --intra-weight <mode>    Within-orbit pooling: size (default) or equal\n";
    std::cout << "  --central <mode>         Central ratio: mean (default) or median\n";
    std::cout << "\nNull model:\n";
    std::cout << "  --null <int>             Permutation trials (default: 0 = disabled)\n";
    std::cout << "  --seed <int>             Random seed (default: random, reported)\n";
    std::cout << "  -t, --threads <int>      Number of threads (default: auto)\n";
    std::cout << "  --in-memory              Keep tables in memory between trials\n";
    std::cout << "\nOutput:\n";
    std::cout << "  -o, --out-dir <dir>      Write ratios.tsv, null_distribution.tsv, summary.json\n";
    std::cout << "  --plots                  Write plot inputs (out-dir defaults to "
              << DEFAULT_PLOT_DIR << ")\n";
    std::cout << "  --plot-command <cmd>     Run '<cmd> <out-dir>' after writing plot inputs\n";
    std::cout << "  --summary <file>         Output run summary (JSON format)\n";
    std::cout << "  --progress <int>         Report every N organisms (default: 1000, 0 = off)\n";
    std::cout << "  -q, --quiet              No progress narration\n";
    std::cout << "  -v, --verbose            Verbose output\n";
    std::cout << "  -V, --version            Show version and exit\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " --map orbits.tsv usage.tsv.gz\n";
    std::cout << "  " << program_name << " --map orbits.tsv usage.tsv.gz --null 1000 --seed 42 -o fc_out\n";
}

Options parse_args(int argc, char* argv[]) {
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto require_value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw ParseArgsExit(1, "Error: Missing value for " + flag);
            }
            return argv[++i];
        };

        auto parse_u64 = [&](const std::string& flag, const std::string& value) -> uint64_t {
            if (value.empty() || value[0] == '-' || value[0] == '+') {
                throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
            }
            try {
                size_t idx = 0;
                unsigned long long parsed = std::stoull(value, &idx);
                if (idx != value.size()) {
                    throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
                }
                return static_cast<uint64_t>(parsed);
            } catch (const ParseArgsExit&) {
                throw;
            } catch (const std::logic_error&) {
                throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
            }
        };

        auto parse_weighting = [&](const std::string& flag, const std::string& value) {
            if (value == "equal") return OrbitWeighting::EQUAL;
            if (value == "size") return OrbitWeighting::SIZE;
            throw ParseArgsExit(1, "Error: " + flag + " must be 'equal' or 'size', got '" + value + "'");
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            throw ParseArgsExit(0);
        } else if (arg == "-V" || arg == "--version") {
            print_version();
            throw ParseArgsExit(0);
        } else if (arg == "--map") {
            opts.map_file = require_value(arg);
        } else if (arg == "-i" || arg == "--input") {
            opts.tables.push_back(require_value(arg));
        } else if (arg == "--progress") {
            opts.progress_interval = parse_u64(arg, require_value(arg));
        } else if (arg == "--null") {
            uint64_t r = parse_u64(arg, require_value(arg));
            if (r > UINT32_MAX) {
                throw ParseArgsExit(1, "Error: --null is too large");
            }
            opts.null_repetitions = static_cast<uint32_t>(r);
        } else if (arg == "--seed") {
            opts.seed = parse_u64(arg, require_value(arg));
        } else if (arg == "--plots") {
            opts.generate_plots = true;
        } else if (arg == "--plot-command") {
            opts.plot_command = require_value(arg);
        } else if (arg == "-o" || arg == "--out-dir") {
            opts.out_dir = require_value(arg);
        } else if (arg == "--summary") {
            opts.summary_file = require_value(arg);
        } else if (arg == "--central") {
            std::string v = require_value(arg);
            if (v == "mean") {
                opts.central = CentralTendency::MEAN;
            } else if (v == "median") {
                opts.central = CentralTendency::MEDIAN;
            } else {
                throw ParseArgsExit(1, "Error: --central must be 'mean' or 'median', got '" + v + "'");
            }
        } else if (arg == "--normalize") {
            std::string v = require_value(arg);
            if (v == "proportion") {
                opts.normalization = Normalization::PROPORTION;
            } else if (v == "mean") {
                opts.normalization = Normalization::MEAN;
            } else {
                throw ParseArgsExit(1, "Error: --normalize must be 'proportion' or 'mean', got '" + v + "'");
            }
        } else if (arg == "--inter-weight") {
            opts.inter_weighting = parse_weighting(arg, require_value(arg));
        } else if (arg == "--intra-weight") {
            opts.intra_weighting = parse_weighting(arg, require_value(arg));
        } else if (arg == "-t" || arg == "--threads") {
            uint64_t t = parse_u64(arg, require_value(arg));
            if (t < 1 || t > 4096) {
                throw ParseArgsExit(1, "Error: --threads must be between 1 and 4096");
            }
            opts.num_threads = static_cast<int>(t);
        } else if (arg == "--in-memory") {
            opts.in_memory = true;
        } else if (arg == "-q" || arg == "--quiet") {
            opts.quiet = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
            throw ParseArgsExit(1, "Error: Unknown option: " + arg);
        } else {
            opts.tables.push_back(arg);
        }
    }

    if (opts.map_file.empty()) {
        throw ParseArgsExit(1, "Error: No orbit map specified (--map)");
    }
    if (opts.tables.empty()) {
        throw ParseArgsExit(1, "Error: No codon usage table specified");
    }
    if (!opts.plot_command.empty() && !opts.generate_plots) {
        throw ParseArgsExit(1, "Error: --plot-command requires --plots");
    }

    return opts;
}

PipelineConfig to_pipeline_config(const Options& opts) {
    PipelineConfig config;
    config.map_path = opts.map_file;
    config.table_paths = opts.tables;
    config.progress_interval = opts.progress_interval;
    config.null_repetitions = opts.null_repetitions;
    config.generate_plots = opts.generate_plots;
    if (!opts.out_dir.empty()) config.output_directory = opts.out_dir;
    config.random_seed = opts.seed;
    config.stat_params.normalization = opts.normalization;
    config.stat_params.inter_weighting = opts.inter_weighting;
    config.stat_params.intra_weighting = opts.intra_weighting;
    config.central = opts.central;
    config.num_threads = opts.num_threads;
    config.in_memory = opts.in_memory;
    config.summary_file = opts.summary_file;
    return config;
}

}  // namespace cli
}  // namespace fcaudit
