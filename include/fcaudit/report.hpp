#pragma once
// Result serialization.
//
// Every file artifact is written to "<path>.tmp" and renamed into place on
// commit(); an uncommitted writer deletes its temporary file, so a failed or
// cancelled run leaves no partial artifact behind.

#include <cstdint>
#include <fstream>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "fcaudit/fc_aggregate.hpp"
#include "fcaudit/fc_statistic.hpp"
#include "fcaudit/null_model.hpp"
#include "fcaudit/significance.hpp"
#include "fcaudit/usage_table.hpp"

namespace fcaudit {

struct RunSummary {
    std::string map_path;
    std::vector<std::string> tables;
    StatisticParams stat_params;
    CentralTendency central = CentralTendency::MEAN;
    AggregateResult observed;
    uint32_t null_repetitions = 0;
    std::optional<SignificanceReport> significance;
    double elapsed_seconds = 0.0;

    // "ok" or "no_valid_organisms"
    const char* status() const {
        return observed.has_valid_organisms() ? "ok" : "no_valid_organisms";
    }
};

// Round-trip precision for finite values, "NA" otherwise
std::string format_number(double value);

// key<TAB>value lines, one per field
void write_summary_text(std::ostream& out, const RunSummary& summary);

void write_summary_json(std::ostream& out, const RunSummary& summary);

class AtomicFileWriter {
public:
    explicit AtomicFileWriter(std::string path);
    ~AtomicFileWriter();

    AtomicFileWriter(const AtomicFileWriter&) = delete;
    AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;

    std::ostream& stream() { return out_; }

    // Flush, close and rename into place. Throws std::runtime_error.
    void commit();

    const std::string& path() const { return path_; }
    bool committed() const { return committed_; }

private:
    std::string path_;
    std::string temp_path_;
    std::ofstream out_;
    bool committed_ = false;
};

/**
 * Per-organism ratio series for external plotting, streamed row by row
 *
 * Columns: organism, source, row, sigma_intra, sigma_inter, ratio, status
 */
class RatioSeriesWriter {
public:
    explicit RatioSeriesWriter(const std::string& path);

    void write(const OrganismRecord& record, const FcStatistic& stat);
    AtomicFileWriter& file() { return file_; }
    const std::string& path() const { return file_.path(); }

private:
    AtomicFileWriter file_;
};

// Columns: trial, central_ratio
void write_null_distribution(AtomicFileWriter& file, const NullDistribution& null);

} // namespace fcaudit
