#pragma once
// End-to-end audit: load, observe, sample the null model, test, report.
//
// The pipeline narrates nothing; callers attach observers for progress.

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "fcaudit/fc_aggregate.hpp"
#include "fcaudit/fc_statistic.hpp"
#include "fcaudit/null_model.hpp"
#include "fcaudit/orbit_map.hpp"
#include "fcaudit/report.hpp"
#include "fcaudit/run_control.hpp"

namespace fcaudit {

struct PipelineConfig {
    std::string map_path;
    std::vector<std::string> table_paths;
    uint64_t progress_interval = 1000;
    uint32_t null_repetitions = 0;   // 0 disables significance testing
    bool generate_plots = false;     // implies an output directory
    std::optional<std::string> output_directory;
    std::optional<uint64_t> random_seed;
    StatisticParams stat_params;
    CentralTendency central = CentralTendency::MEAN;
    int num_threads = 0;
    bool in_memory = false;          // materialize tables once for null passes
    std::string summary_file;        // optional JSON summary path
};

// Output directory used when plots are requested without one
constexpr const char* DEFAULT_PLOT_DIR = "fc_out";

std::optional<std::string> effective_output_directory(const PipelineConfig& config);

struct PipelineObservers {
    std::function<void(const OrbitMap& map)> on_map_loaded;
    std::function<void(const std::string& what)> on_phase;
    ProgressFn on_progress;
    TrialProgressFn on_null_progress;
};

struct PipelineResult {
    RunSummary summary;
    NullDistribution null;
    std::vector<std::string> artifacts;  // committed files
};

/**
 * Run the audit described by `config`.
 *
 * Throws FormatError / SchemaMismatchError before any statistic is reported,
 * DegenerateNullError from the significance step, RunCancelled on
 * cancellation. Artifacts are committed only after every step succeeds.
 */
PipelineResult run_pipeline(const PipelineConfig& config,
                            const PipelineObservers& observers = PipelineObservers(),
                            const CancelToken* cancel = nullptr);

} // namespace fcaudit
