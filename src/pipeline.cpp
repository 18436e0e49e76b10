#include "fcaudit/pipeline.hpp"
#include "fcaudit/usage_table.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <system_error>
#include <vector>

namespace fcaudit {

namespace fs = std::filesystem;

std::optional<std::string> effective_output_directory(const PipelineConfig& config) {
    if (config.output_directory && !config.output_directory->empty()) {
        return config.output_directory;
    }
    if (config.generate_plots) return std::string(DEFAULT_PLOT_DIR);
    return std::nullopt;
}

PipelineResult run_pipeline(const PipelineConfig& config,
                            const PipelineObservers& observers,
                            const CancelToken* cancel) {
    auto t_start = std::chrono::steady_clock::now();
    auto phase = [&](const std::string& what) {
        if (observers.on_phase) observers.on_phase(what);
    };

    PipelineResult result;
    RunSummary& summary = result.summary;
    summary.map_path = config.map_path;
    summary.tables = config.table_paths;
    summary.stat_params = config.stat_params;
    summary.central = config.central;
    summary.null_repetitions = config.null_repetitions;

    // Both inputs are validated before any statistic is computed
    phase("Loading orbit map " + config.map_path);
    const OrbitMap map = load_orbit_map(config.map_path);
    if (observers.on_map_loaded) observers.on_map_loaded(map);

    UsageTableSource tables(config.table_paths, map);

    std::unique_ptr<InMemorySource> cached;
    if (config.in_memory) {
        phase("Loading usage tables into memory");
        cached = std::make_unique<InMemorySource>(InMemorySource::materialize(tables));
    }
    const RecordSource& data = cached ? static_cast<const RecordSource&>(*cached)
                                      : static_cast<const RecordSource&>(tables);

    const auto out_dir = effective_output_directory(config);
    std::unique_ptr<RatioSeriesWriter> series;
    if (out_dir) {
        fs::create_directories(*out_dir);
        series = std::make_unique<RatioSeriesWriter>((fs::path(*out_dir) / "ratios.tsv").string());
    }

    phase("Computing observed ratios over " + data.describe());
    AggregateOptions opts;
    opts.central = config.central;
    opts.progress_interval = config.progress_interval;
    opts.progress = observers.on_progress;
    opts.cancel = cancel;
    if (series) {
        RatioSeriesWriter* w = series.get();
        opts.observer = [w](const OrganismRecord& rec, const FcStatistic& stat) {
            w->write(rec, stat);
        };
    }
    summary.observed = aggregate_source(data, map, config.stat_params, opts);

    if (config.null_repetitions > 0 && summary.observed.has_valid_organisms()) {
        phase("Sampling null model (" + std::to_string(config.null_repetitions) + " permutations)");
        NullModelParams np;
        np.repetitions = config.null_repetitions;
        np.seed = config.random_seed;
        np.num_threads = config.num_threads;
        np.central = config.central;
        result.null = sample_null_distribution(data, map, config.stat_params, np,
                                               observers.on_null_progress, cancel);
        summary.significance = assess_significance(summary.observed.central_ratio, result.null);
    }

    summary.elapsed_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - t_start).count();

    // Everything succeeded: commit artifacts
    std::unique_ptr<AtomicFileWriter> null_file;
    std::unique_ptr<AtomicFileWriter> json_file;
    std::unique_ptr<AtomicFileWriter> extra_json;
    if (out_dir) {
        if (summary.significance) {
            null_file = std::make_unique<AtomicFileWriter>(
                (fs::path(*out_dir) / "null_distribution.tsv").string());
            write_null_distribution(*null_file, result.null);
        }
        json_file = std::make_unique<AtomicFileWriter>((fs::path(*out_dir) / "summary.json").string());
        write_summary_json(json_file->stream(), summary);
    }
    if (!config.summary_file.empty()) {
        extra_json = std::make_unique<AtomicFileWriter>(config.summary_file);
        write_summary_json(extra_json->stream(), summary);
    }

    // Summaries go last, so a summary on disk means the data files are too.
    // A failed rename rolls back the files already moved into place.
    std::vector<AtomicFileWriter*> order;
    if (series) order.push_back(&series->file());
    for (AtomicFileWriter* f : {null_file.get(), json_file.get(), extra_json.get()}) {
        if (f) order.push_back(f);
    }
    try {
        for (AtomicFileWriter* f : order) {
            f->commit();
            result.artifacts.push_back(f->path());
        }
    } catch (const std::exception&) {
        std::error_code ec;
        for (const auto& path : result.artifacts) fs::remove(path, ec);
        throw;
    }
    return result;
}

} // namespace fcaudit
