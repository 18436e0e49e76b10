// fcaudit check: orbit compliance of codon usage, with optional null model
//
// Streams every organism once for the observed ratio, then re-aggregates the
// dataset under R random same-shape relabelings of the orbit map to place the
// observed ratio in its null distribution.

#include "subcommand.hpp"
#include "args.hpp"
#include "fcaudit/log_utils.hpp"
#include "fcaudit/pipeline.hpp"
#include "fcaudit/run_control.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>

namespace fcaudit {
namespace cli {

namespace {

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

void run_plot_command(const std::string& command, const std::string& out_dir, bool quiet) {
    const std::string full = command + " " + shell_quote(out_dir);
    if (!quiet) std::cerr << "Running plot command: " << full << "\n";
    const int rc = std::system(full.c_str());
    if (rc != 0) {
        std::cerr << "Warning: plot command exited with status " << rc
                  << "; results in " << out_dir << " are complete\n";
    }
}

}  // namespace

int cmd_check(int argc, char* argv[]) {
    Options opts;
    try {
        opts = parse_args(argc, argv);
    } catch (const ParseArgsExit& e) {
        if (e.what()[0] != '\0') {
            std::cerr << e.what() << "\n";
            std::cerr << "Run 'fcaudit check --help' for usage information.\n";
        }
        return e.exit_code();
    }

    install_interrupt_handlers();
    CancelToken& cancel = process_cancel_token();

    const PipelineConfig config = to_pipeline_config(opts);
    const bool narrate = !opts.quiet;
    auto run_start = std::chrono::steady_clock::now();
    auto phase_start = run_start;
    bool in_phase = false;

    PipelineObservers observers;
    observers.on_phase = [&](const std::string& what) {
        if (!narrate) return;
        auto now = std::chrono::steady_clock::now();
        if (opts.verbose && in_phase) {
            std::cerr << "  (" << log_utils::format_elapsed(phase_start, now) << ")\n";
        }
        phase_start = now;
        in_phase = true;
        std::cerr << what << "\n";
    };
    observers.on_map_loaded = [&](const OrbitMap& map) {
        if (!narrate) return;
        std::cerr << "  " << map.num_orbits() << " orbits, sizes:";
        for (size_t s : map.size_profile()) std::cerr << " " << s;
        std::cerr << "\n";
        if (opts.verbose) {
            std::cerr << "  Tables: " << config.table_paths.size() << "\n";
            for (const auto& t : config.table_paths) std::cerr << "    " << t << "\n";
        }
    };
    if (narrate && config.progress_interval > 0) {
        observers.on_progress = [](uint64_t n) {
            std::cerr << "  Processed " << n << " organisms\n";
        };
    }
    if (narrate) {
        uint32_t step = config.null_repetitions / 10;
        if (step == 0) step = 1;
        if (opts.verbose) step = 1;
        observers.on_null_progress = [step](uint32_t done, uint32_t total) {
            if (done % step == 0 || done == total) {
                std::cerr << "  Null trials " << log_utils::format_progress(done, total) << "\n";
            }
        };
    }

    PipelineResult result;
    try {
        result = run_pipeline(config, observers, &cancel);
    } catch (const RunCancelled&) {
        std::cerr << "Interrupted; no results written\n";
        return 130;
    } catch (const std::exception& e) {
        // InputError and DegenerateNullError messages name their source
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    const RunSummary& summary = result.summary;
    write_summary_text(std::cout, summary);
    std::cout.flush();

    if (narrate) {
        const AggregateResult& o = summary.observed;
        if (!o.has_valid_organisms()) {
            std::cerr << "No organism produced a defined ratio ("
                      << o.zero_usage << " all-zero, "
                      << o.zero_inter_spread << " with equal orbit means)\n";
        } else if (config.null_repetitions > 0 && summary.significance) {
            std::cerr << "Null model seed: " << summary.significance->seed
                      << " (pass --seed to reproduce)\n";
        }
        for (const auto& path : result.artifacts) {
            std::cerr << "Wrote " << path << "\n";
        }
        std::cerr << "Total runtime: "
                  << log_utils::format_elapsed(run_start, std::chrono::steady_clock::now()) << "\n";
    }

    if (!opts.plot_command.empty()) {
        if (auto dir = effective_output_directory(config)) {
            run_plot_command(opts.plot_command, *dir, opts.quiet);
        }
    }

    return 0;
}

}  // namespace cli
}  // namespace fcaudit

namespace {
    struct CheckRegistrar {
        CheckRegistrar() {
            fcaudit::cli::SubcommandRegistry::instance().register_command(
                "check",
                "Orbit compliance ratio with permutation significance",
                fcaudit::cli::cmd_check, 10);
        }
    };
    static CheckRegistrar registrar;
}
