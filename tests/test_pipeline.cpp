// tests/test_pipeline.cpp
//
// End-to-end runs over files on disk:
//   - no valid organisms is a result ("no_valid_organisms", NA), not an error
//   - seed + R make the text summary bit-identical; --in-memory agrees
//   - artifacts land only on success, with no temporary files left behind
//   - input errors surface before anything is written
//   - a failed commit leaves no partial artifact set

#include "fixtures.hpp"
#include "fcaudit/errors.hpp"
#include "fcaudit/pipeline.hpp"
#include "fcaudit/report.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using fixtures::expect;
namespace fs = std::filesystem;

namespace {

struct Workspace {
    std::string dir = fixtures::make_tmpdir("pipeline");
    std::string map_path = dir + "/orbits.tsv";

    Workspace() { fixtures::write_file(map_path, fixtures::map_text(fixtures::standard_map())); }
    ~Workspace() { fs::remove_all(dir); }

    std::string table(const std::string& name, const std::vector<fcaudit::OrganismRecord>& recs) const {
        const std::string path = dir + "/" + name;
        fixtures::write_file(path, fixtures::table_text(recs, {"taxid"}));
        return path;
    }

    fcaudit::PipelineConfig config(const std::vector<std::string>& tables) const {
        fcaudit::PipelineConfig c;
        c.map_path = map_path;
        c.table_paths = tables;
        return c;
    }
};

std::string summary_text(const fcaudit::RunSummary& s) {
    std::ostringstream os;
    fcaudit::write_summary_text(os, s);
    return os.str();
}

bool has_temp_files(const std::string& dir) {
    if (!fs::exists(dir)) return false;
    for (const auto& entry : fs::recursive_directory_iterator(dir)) {
        if (entry.path().extension() == ".tmp") return true;
    }
    return false;
}

size_t count_lines(const std::string& text) {
    size_t n = 0;
    for (char c : text) n += (c == '\n');
    return n;
}

int test_no_valid_organisms() {
    std::cout << "[pipeline] ten uniform organisms\n";
    int failed = 0;
    Workspace ws;
    std::vector<fcaudit::OrganismRecord> flat;
    for (int i = 0; i < 10; ++i) flat.push_back(fixtures::uniform_organism("flat" + std::to_string(i), 3.0 + i));

    auto cfg = ws.config({ws.table("flat.tsv", flat)});
    cfg.null_repetitions = 50;
    cfg.random_seed = 1;
    cfg.output_directory = ws.dir + "/out";

    const auto result = fcaudit::run_pipeline(cfg);
    const auto& s = result.summary;
    expect(s.observed.sample_size == 0, "sample size 0", failed);
    expect(s.observed.zero_inter_spread == 10, "all excluded for zero inter spread", failed);
    expect(std::string(s.status()) == "no_valid_organisms", "explicit status", failed);
    expect(!s.significance.has_value(), "significance skipped", failed);

    const std::string text = summary_text(s);
    expect(text.find("status\tno_valid_organisms\n") != std::string::npos, "status line", failed);
    expect(text.find("observed_ratio\tNA\n") != std::string::npos, "ratio reported as NA", failed);
    expect(text.find("p_value\tNA\n") != std::string::npos, "p reported as NA", failed);
    expect(text.find("nan") == std::string::npos, "no raw nan in the summary", failed);

    const std::string json = fixtures::read_file(ws.dir + "/out/summary.json");
    expect(json.find("\"status\": \"no_valid_organisms\"") != std::string::npos, "json status", failed);
    expect(json.find("\"ratio\": null") != std::string::npos, "json ratio null", failed);
    expect(json.find(": nan") == std::string::npos && json.find(": -nan") == std::string::npos,
           "no raw nan in json", failed);
    expect(!fs::exists(ws.dir + "/out/null_distribution.tsv"), "no null distribution written", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_reproducible_run() {
    std::cout << "[pipeline] seed 42, R 100, twice\n";
    int failed = 0;
    Workspace ws;
    const auto map = fixtures::standard_map();
    const std::string a = ws.table("a.tsv", fixtures::synthetic_dataset(map, 12, 0.25, 100));
    const std::string b = ws.table("b.tsv", fixtures::synthetic_dataset(map, 8, 0.25, 200));

    auto cfg = ws.config({a, b});
    cfg.null_repetitions = 100;
    cfg.random_seed = 42;

    const auto first = fcaudit::run_pipeline(cfg);
    const auto second = fcaudit::run_pipeline(cfg);
    expect(first.summary.significance.has_value(), "significance computed", failed);
    expect(first.summary.observed.records_processed == 20, "both tables read", failed);
    if (first.summary.significance && second.summary.significance) {
        expect(first.summary.significance->z == second.summary.significance->z, "identical Z", failed);
        expect(first.summary.significance->p_value == second.summary.significance->p_value,
               "identical p", failed);
    }
    expect(summary_text(first.summary) == summary_text(second.summary), "identical summaries", failed);
    expect(first.artifacts.empty(), "no artifacts without an output directory", failed);

    auto mem = cfg;
    mem.in_memory = true;
    mem.num_threads = 2;
    const auto in_memory = fcaudit::run_pipeline(mem);
    expect(summary_text(in_memory.summary) == summary_text(first.summary),
           "in-memory run matches streaming run", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_artifacts() {
    std::cout << "[pipeline] artifacts and observers\n";
    int failed = 0;
    Workspace ws;
    const auto map = fixtures::standard_map();
    auto recs = fixtures::synthetic_dataset(map, 9, 0.2, 7);
    recs.push_back(fixtures::uniform_organism("flat"));
    const std::string table = ws.table("usage.tsv", recs);

    auto cfg = ws.config({table});
    cfg.null_repetitions = 30;
    cfg.random_seed = 5;
    cfg.output_directory = ws.dir + "/nested/out";
    cfg.summary_file = ws.dir + "/run.json";
    cfg.progress_interval = 4;

    std::vector<std::string> phases;
    std::vector<uint64_t> ticks;
    uint32_t trials = 0;
    bool saw_map = false;
    fcaudit::PipelineObservers obs;
    obs.on_phase = [&](const std::string& what) { phases.push_back(what); };
    obs.on_progress = [&](uint64_t n) { ticks.push_back(n); };
    obs.on_null_progress = [&](uint32_t, uint32_t) { ++trials; };
    obs.on_map_loaded = [&](const fcaudit::OrbitMap& m) { saw_map = m.num_orbits() == 21; };

    const auto result = fcaudit::run_pipeline(cfg, obs);
    expect(saw_map, "map observer called", failed);
    expect(phases.size() >= 3, "phases narrated", failed);
    expect((ticks == std::vector<uint64_t>{4, 8}), "progress every 4 organisms", failed);
    expect(trials == 30, "null progress per trial", failed);
    expect(result.artifacts.size() == 4, "four artifacts", failed);

    const std::string out = ws.dir + "/nested/out";
    const std::string ratios = fixtures::read_file(out + "/ratios.tsv");
    expect(count_lines(ratios) == 11, "ratios.tsv: header + one row per organism", failed);
    expect(ratios.find("\nflat\t") != std::string::npos &&
           ratios.find("\tNA\tzero_inter_spread\n") != std::string::npos,
           "excluded organism listed with its reason", failed);

    const std::string null_tsv = fixtures::read_file(out + "/null_distribution.tsv");
    expect(null_tsv.rfind("# seed=5\n", 0) == 0, "null file starts with the seed", failed);
    expect(count_lines(null_tsv) == 32, "null file: seed + header + 30 trials", failed);

    expect(fs::exists(out + "/summary.json"), "summary.json in the output directory", failed);
    const std::string json = fixtures::read_file(cfg.summary_file);
    expect(json.find("\"repetitions\": 30") != std::string::npos, "summary file has the null model", failed);
    expect(json.find("\"seed\": 5") != std::string::npos, "summary file has the seed", failed);
    expect(!has_temp_files(ws.dir), "no temporary files left", failed);

    fcaudit::PipelineConfig plots;
    plots.generate_plots = true;
    expect(fcaudit::effective_output_directory(plots) == std::optional<std::string>("fc_out"),
           "plots default to fc_out", failed);
    plots.output_directory = "elsewhere";
    expect(fcaudit::effective_output_directory(plots) == std::optional<std::string>("elsewhere"),
           "explicit directory wins", failed);
    expect(!fcaudit::effective_output_directory(fcaudit::PipelineConfig()).has_value(),
           "no directory by default", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

template <typename Error>
bool run_raises(const fcaudit::PipelineConfig& cfg, const fcaudit::CancelToken* cancel = nullptr) {
    try {
        (void)fcaudit::run_pipeline(cfg, fcaudit::PipelineObservers(), cancel);
    } catch (const Error&) {
        return true;
    }
    return false;
}

int test_failures_write_nothing() {
    std::cout << "[pipeline] errors leave no output\n";
    int failed = 0;
    Workspace ws;
    const auto map = fixtures::standard_map();
    const auto recs = fixtures::synthetic_dataset(map, 6, 0.2, 3);
    const std::string good = ws.table("good.tsv", recs);
    const std::string out = ws.dir + "/out";

    // Bad value in the last row of a later table
    std::string text = fixtures::table_text(recs, {"taxid"});
    text.replace(text.rfind('\t') + 1, std::string::npos, "-1\n");
    const std::string bad_row = ws.dir + "/bad_row.tsv";
    fixtures::write_file(bad_row, text);

    auto cfg = ws.config({good, bad_row});
    cfg.output_directory = out;
    cfg.null_repetitions = 10;
    expect(run_raises<fcaudit::FormatError>(cfg), "bad cell fails the run", failed);
    expect(!fs::exists(out + "/ratios.tsv"), "no ratios.tsv after failure", failed);
    expect(!has_temp_files(ws.dir), "temporary ratios file removed", failed);

    // Header mismatch is caught before the output directory is touched
    const std::string bad_header = ws.dir + "/bad_header.tsv";
    fixtures::write_file(bad_header, "organism\tUUU\tUUC\n");
    auto schema = ws.config({good, bad_header});
    schema.output_directory = ws.dir + "/never";
    expect(run_raises<fcaudit::SchemaMismatchError>(schema), "schema mismatch fails the run", failed);
    expect(!fs::exists(ws.dir + "/never"), "output directory not created", failed);

    const std::string short_map = ws.dir + "/short.tsv";
    std::string map_text = fixtures::map_text(map);
    map_text.erase(map_text.rfind('\n', map_text.size() - 2) + 1);
    fixtures::write_file(short_map, map_text);
    auto bad_map = ws.config({good});
    bad_map.map_path = short_map;
    expect(run_raises<fcaudit::FormatError>(bad_map), "63-row map fails the run", failed);

    // Last rename fails: the summary target is a non-empty directory
    const std::string blocked = ws.dir + "/blocked.json";
    fs::create_directories(blocked);
    fixtures::write_file(blocked + "/keep", "x\n");
    auto late = ws.config({good});
    late.output_directory = ws.dir + "/late";
    late.null_repetitions = 10;
    late.random_seed = 3;
    late.summary_file = blocked;
    expect(run_raises<std::runtime_error>(late), "failed final rename fails the run", failed);
    expect(!fs::exists(ws.dir + "/late/ratios.tsv") &&
           !fs::exists(ws.dir + "/late/null_distribution.tsv") &&
           !fs::exists(ws.dir + "/late/summary.json"),
           "files committed before the failure are rolled back", failed);
    expect(fs::exists(blocked + "/keep"), "blocking directory untouched", failed);
    expect(!has_temp_files(ws.dir), "no temporary files after a failed commit", failed);

    fcaudit::CancelToken cancel;
    cancel.request();
    auto cancelled = ws.config({good});
    cancelled.output_directory = ws.dir + "/cancelled";
    expect(run_raises<fcaudit::RunCancelled>(cancelled, &cancel), "cancelled run", failed);
    expect(!fs::exists(ws.dir + "/cancelled/ratios.tsv"), "no ratios.tsv after cancel", failed);
    expect(!has_temp_files(ws.dir), "no temporary files after cancel", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

}  // namespace

int main() {
    int total = 0;
    total += test_no_valid_organisms();
    total += test_reproducible_run();
    total += test_artifacts();
    total += test_failures_write_nothing();

    if (total == 0) {
        std::cout << "\nAll pipeline tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
