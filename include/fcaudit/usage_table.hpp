#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "fcaudit/codon_tables.hpp"
#include "fcaudit/orbit_map.hpp"

namespace fcaudit {

/**
 * One organism's codon usage, in canonical codon order
 */
struct OrganismRecord {
    std::string id;
    std::array<double, NUM_CODONS> usage{};
    std::string source;  // table the row came from
    size_t row = 0;      // 1-based line number in that table
};

/**
 * Check that a table's codon columns are exactly the orbit map's codon domain.
 *
 * `codon_columns` are the header names of the usage columns (the last 64).
 * Returns, for each canonical codon, the position within `codon_columns`
 * that holds it. Throws SchemaMismatchError on an unknown symbol, a duplicate,
 * a missing codon, or a wrong column count.
 */
std::array<size_t, NUM_CODONS> cross_validate(const OrbitMap& map,
                                               const std::vector<std::string>& codon_columns,
                                               const std::string& source);

/**
 * Streaming reader for a codon usage table (tab-delimited, plain or .gz)
 *
 * Layout: header row; column 0 = organism id; last 64 columns = codon usage;
 * any columns in between are metadata and ignored. The header is read and
 * cross-validated against the orbit map on construction.
 */
class UsageTableReader {
public:
    UsageTableReader(const std::string& path, const OrbitMap& map);
    ~UsageTableReader();

    UsageTableReader(const UsageTableReader&) = delete;
    UsageTableReader& operator=(const UsageTableReader&) = delete;

    /**
     * Read next organism. Returns false at end of table.
     * Throws FormatError on a field-count mismatch, a non-numeric value or a
     * negative / non-finite value.
     */
    bool read_next(OrganismRecord& record);

    const std::vector<std::string>& header() const;

    // Names of the 64 usage columns as they appear in the header
    std::vector<std::string> codon_columns() const;

    size_t rows_read() const;

    const std::string& path() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * Dataset access: a re-openable stream of organism records
 *
 * Each open() returns an independent cursor positioned at the first record,
 * so a source can be scanned once per null-model trial and concurrently from
 * several threads.
 */
class RecordCursor {
public:
    virtual ~RecordCursor() = default;
    virtual bool next(OrganismRecord& record) = 0;
};

class RecordSource {
public:
    virtual ~RecordSource() = default;
    virtual std::unique_ptr<RecordCursor> open() const = 0;
    virtual std::string describe() const = 0;
};

/**
 * File-backed dataset: one or more usage tables read in order
 *
 * Every table header is validated against the map when the source is built,
 * before any record is read. Memory use does not depend on table size.
 */
class UsageTableSource : public RecordSource {
public:
    UsageTableSource(std::vector<std::string> paths, const OrbitMap& map);

    std::unique_ptr<RecordCursor> open() const override;
    std::string describe() const override;

    const std::vector<std::string>& paths() const { return paths_; }

private:
    std::vector<std::string> paths_;
    OrbitMap map_;
};

/**
 * Materialized dataset (tests, and --in-memory for repeated null passes)
 */
class InMemorySource : public RecordSource {
public:
    InMemorySource() = default;
    explicit InMemorySource(std::vector<OrganismRecord> records)
        : records_(std::move(records)) {}

    // Drain another source into memory
    static InMemorySource materialize(const RecordSource& source);

    std::unique_ptr<RecordCursor> open() const override;
    std::string describe() const override;

    void add(OrganismRecord record) { records_.push_back(std::move(record)); }
    const std::vector<OrganismRecord>& records() const { return records_; }
    size_t size() const { return records_.size(); }

private:
    std::vector<OrganismRecord> records_;
};

} // namespace fcaudit
