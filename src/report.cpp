#include "fcaudit/report.hpp"
#include "fcaudit/version.h"

#include <cmath>
#include <cstdio>
#include <iomanip>
#include <limits>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace fcaudit {

std::string format_number(double value) {
    if (!std::isfinite(value)) return "NA";
    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
    return oss.str();
}

namespace {

std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

std::string json_number(double value) {
    return std::isfinite(value) ? format_number(value) : "null";
}

} // namespace

void write_summary_text(std::ostream& out, const RunSummary& s) {
    const AggregateResult& o = s.observed;
    out << "status\t" << s.status() << "\n";
    out << "records\t" << o.records_processed << "\n";
    out << "sample_size\t" << o.sample_size << "\n";
    out << "excluded\t" << o.excluded_count << "\n";
    out << "excluded_zero_usage\t" << o.zero_usage << "\n";
    out << "excluded_zero_inter_spread\t" << o.zero_inter_spread << "\n";
    out << "central\t" << central_to_string(s.central) << "\n";
    out << "observed_ratio\t" << format_number(o.central_ratio) << "\n";
    out << "mean_ratio\t" << format_number(o.mean_ratio) << "\n";
    out << "sd_ratio\t" << format_number(o.sd_ratio) << "\n";

    if (s.significance) {
        const SignificanceReport& r = *s.significance;
        out << "null_repetitions\t" << r.repetitions << "\n";
        out << "null_valid_trials\t" << r.valid_trials << "\n";
        out << "null_mean\t" << format_number(r.null_mean) << "\n";
        out << "null_sd\t" << format_number(r.null_sd) << "\n";
        out << "null_se\t" << format_number(r.null_se) << "\n";
        out << "z\t" << format_number(r.z) << "\n";
        out << "p_value\t" << format_number(r.p_value) << "\n";
        out << "seed\t" << r.seed << "\n";
    } else {
        out << "null_repetitions\t" << s.null_repetitions << "\n";
        out << "z\tNA\n";
        out << "p_value\tNA\n";
    }
}

void write_summary_json(std::ostream& out, const RunSummary& s) {
    const AggregateResult& o = s.observed;
    out << "{\n";
    out << "  \"version\": \"" << FCAUDIT_VERSION << "\",\n";
    out << "  \"status\": \"" << s.status() << "\",\n";
    out << "  \"orbit_map\": \"" << json_escape(s.map_path) << "\",\n";
    out << "  \"tables\": [";
    for (size_t i = 0; i < s.tables.size(); ++i) {
        out << (i ? ", " : "") << "\"" << json_escape(s.tables[i]) << "\"";
    }
    out << "],\n";
    out << "  \"statistic\": {\n";
    out << "    \"normalization\": \"" << normalization_to_string(s.stat_params.normalization) << "\",\n";
    out << "    \"inter_weighting\": \"" << weighting_to_string(s.stat_params.inter_weighting) << "\",\n";
    out << "    \"intra_weighting\": \"" << weighting_to_string(s.stat_params.intra_weighting) << "\",\n";
    out << "    \"central\": \"" << central_to_string(s.central) << "\"\n";
    out << "  },\n";
    out << "  \"observed\": {\n";
    out << "    \"records\": " << o.records_processed << ",\n";
    out << "    \"sample_size\": " << o.sample_size << ",\n";
    out << "    \"excluded\": " << o.excluded_count << ",\n";
    out << "    \"excluded_zero_usage\": " << o.zero_usage << ",\n";
    out << "    \"excluded_zero_inter_spread\": " << o.zero_inter_spread << ",\n";
    out << "    \"ratio\": " << json_number(o.central_ratio) << ",\n";
    out << "    \"mean_ratio\": " << json_number(o.mean_ratio) << ",\n";
    out << "    \"sd_ratio\": " << json_number(o.sd_ratio) << "\n";
    out << "  },\n";
    out << "  \"null_model\": ";
    if (s.significance) {
        const SignificanceReport& r = *s.significance;
        out << "{\n";
        out << "    \"repetitions\": " << r.repetitions << ",\n";
        out << "    \"valid_trials\": " << r.valid_trials << ",\n";
        out << "    \"seed\": " << r.seed << ",\n";
        out << "    \"null_mean\": " << json_number(r.null_mean) << ",\n";
        out << "    \"null_sd\": " << json_number(r.null_sd) << ",\n";
        out << "    \"null_se\": " << json_number(r.null_se) << ",\n";
        out << "    \"null_at_or_below\": " << r.null_at_or_below << ",\n";
        out << "    \"z\": " << json_number(r.z) << ",\n";
        out << "    \"p_value\": " << json_number(r.p_value) << "\n";
        out << "  },\n";
    } else {
        out << "null,\n";
    }
    out << "  \"processing_time_seconds\": " << std::fixed << std::setprecision(1)
        << s.elapsed_seconds << "\n";
    out << std::defaultfloat;
    out << "}\n";
}

// ---------------------------------------------------------------------------
// File artifacts
// ---------------------------------------------------------------------------

AtomicFileWriter::AtomicFileWriter(std::string path)
    : path_(std::move(path)), temp_path_(path_ + ".tmp") {
    out_.open(temp_path_, std::ios::out | std::ios::trunc);
    if (!out_) {
        throw std::runtime_error("Cannot create output file: " + temp_path_);
    }
}

AtomicFileWriter::~AtomicFileWriter() {
    if (!committed_) {
        out_.close();
        std::remove(temp_path_.c_str());
    }
}

void AtomicFileWriter::commit() {
    if (committed_) return;
    out_.flush();
    if (!out_) {
        throw std::runtime_error("Write failed: " + temp_path_);
    }
    out_.close();
    if (std::rename(temp_path_.c_str(), path_.c_str()) != 0) {
        throw std::runtime_error("Cannot move " + temp_path_ + " to " + path_);
    }
    committed_ = true;
}

RatioSeriesWriter::RatioSeriesWriter(const std::string& path) : file_(path) {
    file_.stream() << "organism\tsource\trow\tsigma_intra\tsigma_inter\tratio\tstatus\n";
}

void RatioSeriesWriter::write(const OrganismRecord& record, const FcStatistic& stat) {
    std::ostream& out = file_.stream();
    const bool no_spread = stat.exclusion == ExclusionReason::ZERO_USAGE;
    out << record.id << '\t'
        << record.source << '\t'
        << record.row << '\t'
        << (no_spread ? "NA" : format_number(stat.intra_spread)) << '\t'
        << (no_spread ? "NA" : format_number(stat.inter_spread)) << '\t'
        << format_number(stat.ratio) << '\t'
        << exclusion_to_string(stat.exclusion) << '\n';
}

void write_null_distribution(AtomicFileWriter& file, const NullDistribution& null) {
    std::ostream& out = file.stream();
    out << "# seed=" << null.seed << "\n";
    out << "trial\tcentral_ratio\n";
    for (size_t i = 0; i < null.samples.size(); ++i) {
        out << (i + 1) << '\t' << format_number(null.samples[i]) << '\n';
    }
}

} // namespace fcaudit
