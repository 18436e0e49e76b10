#ifndef FCAUDIT_CLI_ARGS_HPP
#define FCAUDIT_CLI_ARGS_HPP

#include <string>
#include <vector>
#include <optional>
#include <cstddef>
#include <cstdint>
#include <stdexcept>

#include "fcaudit/pipeline.hpp"

namespace fcaudit {
namespace cli {

// Thrown by parse_args instead of calling exit(): code 0 for --help/--version,
// 1 for usage errors. `message` is empty when usage was already printed.
class ParseArgsExit : public std::runtime_error {
public:
    explicit ParseArgsExit(int code, const std::string& message = std::string())
        : std::runtime_error(message), exit_code_(code) {}

    int exit_code() const { return exit_code_; }

private:
    int exit_code_;
};

struct Options {
    std::string map_file;
    std::vector<std::string> tables;       // positional or -i
    uint64_t progress_interval = 1000;     // 0 = no progress lines
    uint32_t null_repetitions = 0;         // 0 = observed ratio only
    bool generate_plots = false;
    std::string out_dir;                   // empty = no artifacts (fc_out with --plots)
    std::string summary_file;              // JSON summary
    std::string plot_command;              // run as: <cmd> <out_dir>
    std::optional<uint64_t> seed;
    CentralTendency central = CentralTendency::MEAN;
    Normalization normalization = Normalization::PROPORTION;
    OrbitWeighting inter_weighting = OrbitWeighting::SIZE;
    OrbitWeighting intra_weighting = OrbitWeighting::SIZE;
    int num_threads = 0;
    bool in_memory = false;
    bool quiet = false;
    bool verbose = false;
};

// Print version string to stdout
void print_version();

// Print `check` usage/help to stdout
void print_usage(const char* program_name);

// Parse `check` arguments (argv[0] is the subcommand name).
// Throws ParseArgsExit with code 0 for --help/--version and 1 on errors.
Options parse_args(int argc, char* argv[]);

PipelineConfig to_pipeline_config(const Options& opts);

}  // namespace cli
}  // namespace fcaudit

#endif  // FCAUDIT_CLI_ARGS_HPP
