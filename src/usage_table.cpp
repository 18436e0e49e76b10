#include "fcaudit/usage_table.hpp"
#include "fcaudit/errors.hpp"
#include "fcaudit/fast_tsv.hpp"
#include "fcaudit/gz_line_reader.hpp"

#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace fcaudit {

std::array<size_t, NUM_CODONS> cross_validate(const OrbitMap& map,
                                               const std::vector<std::string>& codon_columns,
                                               const std::string& source) {
    if (codon_columns.size() != static_cast<size_t>(NUM_CODONS)) {
        throw SchemaMismatchError(source, "",
                                  "expected 64 codon columns, found " +
                                  std::to_string(codon_columns.size()));
    }

    constexpr size_t UNSET = static_cast<size_t>(-1);
    std::array<size_t, NUM_CODONS> column_of;
    column_of.fill(UNSET);

    for (size_t col = 0; col < codon_columns.size(); ++col) {
        const std::string& name = codon_columns[col];
        const int codon = codon_to_idx(name);
        if (codon < 0) {
            throw SchemaMismatchError(source, name,
                                      "column is not a codon of the orbit map domain");
        }
        if (column_of[static_cast<size_t>(codon)] != UNSET) {
            throw SchemaMismatchError(source, name,
                                      "codon " + codon_name(codon) + " appears in more than one column");
        }
        column_of[static_cast<size_t>(codon)] = col;
    }

    // 64 distinct codons cover the domain; the loop below also guards against
    // a map whose domain ever diverges from the full codon set
    for (const auto& orbit_members : map.members()) {
        for (uint8_t codon : orbit_members) {
            if (column_of[codon] == UNSET) {
                throw SchemaMismatchError(source, codon_name(codon),
                                          "orbit map codon missing from usage table");
            }
        }
    }
    return column_of;
}

// ---------------------------------------------------------------------------
// UsageTableReader
// ---------------------------------------------------------------------------

class UsageTableReader::Impl {
public:
    GzLineReader reader;
    std::vector<std::string> header;
    std::array<size_t, NUM_CODONS> field_of{};  // canonical codon -> field index
    size_t first_codon_field = 0;
    size_t rows = 0;
    std::string line;
    std::vector<std::string_view> fields;

    Impl(const std::string& path, const OrbitMap& map) : reader(path) {
        if (!reader.readline(line)) {
            throw FormatError(path, 0, "", "usage table is empty (no header row)");
        }
        split_fields(line, '\t', fields);
        for (auto f : fields) header.emplace_back(trim(f));

        if (header.size() < static_cast<size_t>(NUM_CODONS) + 1) {
            throw SchemaMismatchError(path, "",
                                      "header has " + std::to_string(header.size()) +
                                      " columns; expected an id column plus 64 codon columns");
        }
        first_codon_field = header.size() - static_cast<size_t>(NUM_CODONS);
        std::vector<std::string> codon_cols(header.begin() + static_cast<std::ptrdiff_t>(first_codon_field),
                                            header.end());
        auto column_of = cross_validate(map, codon_cols, path);
        for (int c = 0; c < NUM_CODONS; ++c) {
            field_of[static_cast<size_t>(c)] = first_codon_field + column_of[static_cast<size_t>(c)];
        }
    }

    bool next(OrganismRecord& rec) {
        while (reader.readline(line)) {
            if (is_blank_line(line)) continue;
            const size_t row = reader.line_number();
            split_fields(line, '\t', fields);
            if (fields.size() != header.size()) {
                throw FormatError(reader.path(), row, "",
                                  "expected " + std::to_string(header.size()) +
                                  " fields, found " + std::to_string(fields.size()));
            }

            rec.id.assign(trim(fields[0]));
            rec.source = reader.path();
            rec.row = row;
            for (int c = 0; c < NUM_CODONS; ++c) {
                const size_t f = field_of[static_cast<size_t>(c)];
                double v = 0.0;
                if (!parse_double(fields[f], v)) {
                    throw FormatError(reader.path(), row, header[f],
                                      "non-numeric value '" + std::string(trim(fields[f])) + "'");
                }
                if (!std::isfinite(v)) {
                    throw FormatError(reader.path(), row, header[f],
                                      "non-finite value '" + std::string(trim(fields[f])) + "'");
                }
                if (v < 0.0) {
                    throw FormatError(reader.path(), row, header[f],
                                      "negative value '" + std::string(trim(fields[f])) + "'");
                }
                rec.usage[static_cast<size_t>(c)] = v;
            }
            ++rows;
            return true;
        }
        return false;
    }
};

UsageTableReader::UsageTableReader(const std::string& path, const OrbitMap& map)
    : impl_(std::make_unique<Impl>(path, map)) {}

UsageTableReader::~UsageTableReader() = default;

bool UsageTableReader::read_next(OrganismRecord& record) {
    return impl_->next(record);
}

const std::vector<std::string>& UsageTableReader::header() const {
    return impl_->header;
}

std::vector<std::string> UsageTableReader::codon_columns() const {
    return std::vector<std::string>(
        impl_->header.begin() + static_cast<std::ptrdiff_t>(impl_->first_codon_field),
        impl_->header.end());
}

size_t UsageTableReader::rows_read() const {
    return impl_->rows;
}

const std::string& UsageTableReader::path() const {
    return impl_->reader.path();
}

// ---------------------------------------------------------------------------
// Record sources
// ---------------------------------------------------------------------------

namespace {

class TableChainCursor : public RecordCursor {
public:
    TableChainCursor(const std::vector<std::string>& paths, const OrbitMap& map)
        : paths_(paths), map_(map) {}

    bool next(OrganismRecord& record) override {
        while (true) {
            if (!current_) {
                if (next_path_ >= paths_.size()) return false;
                current_ = std::make_unique<UsageTableReader>(paths_[next_path_++], map_);
            }
            if (current_->read_next(record)) return true;
            current_.reset();
        }
    }

private:
    const std::vector<std::string>& paths_;
    const OrbitMap& map_;
    size_t next_path_ = 0;
    std::unique_ptr<UsageTableReader> current_;
};

class VectorCursor : public RecordCursor {
public:
    explicit VectorCursor(const std::vector<OrganismRecord>& records) : records_(records) {}

    bool next(OrganismRecord& record) override {
        if (pos_ >= records_.size()) return false;
        record = records_[pos_++];
        return true;
    }

private:
    const std::vector<OrganismRecord>& records_;
    size_t pos_ = 0;
};

} // namespace

UsageTableSource::UsageTableSource(std::vector<std::string> paths, const OrbitMap& map)
    : paths_(std::move(paths)), map_(map) {
    if (paths_.empty()) {
        throw std::invalid_argument("UsageTableSource: no usage tables given");
    }
    // Fail on any header problem before the first record is computed
    for (const auto& path : paths_) {
        UsageTableReader probe(path, map_);
    }
}

std::unique_ptr<RecordCursor> UsageTableSource::open() const {
    return std::make_unique<TableChainCursor>(paths_, map_);
}

std::string UsageTableSource::describe() const {
    std::string out;
    for (size_t i = 0; i < paths_.size(); ++i) {
        if (i > 0) out += ", ";
        out += paths_[i];
    }
    return out;
}

InMemorySource InMemorySource::materialize(const RecordSource& source) {
    InMemorySource mem;
    auto cursor = source.open();
    OrganismRecord rec;
    while (cursor->next(rec)) {
        mem.records_.push_back(rec);
    }
    return mem;
}

std::unique_ptr<RecordCursor> InMemorySource::open() const {
    return std::make_unique<VectorCursor>(records_);
}

std::string InMemorySource::describe() const {
    return "in-memory dataset (" + std::to_string(records_.size()) + " organisms)";
}

} // namespace fcaudit
