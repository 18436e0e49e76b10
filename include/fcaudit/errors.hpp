#pragma once
// Fatal error taxonomy.
//
// InputError subclasses carry the offending file, 1-based row (0 = header or
// whole file) and field so that the diagnostic is actionable on its own.

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace fcaudit {

class InputError : public std::runtime_error {
public:
    InputError(const std::string& kind,
               std::string file,
               size_t row,
               std::string field,
               std::string detail)
        : std::runtime_error(format(kind, file, row, field, detail)),
          file_(std::move(file)),
          row_(row),
          field_(std::move(field)),
          detail_(std::move(detail)) {}

    const std::string& file() const { return file_; }
    size_t row() const { return row_; }
    const std::string& field() const { return field_; }
    const std::string& detail() const { return detail_; }

private:
    static std::string format(const std::string& kind,
                              const std::string& file,
                              size_t row,
                              const std::string& field,
                              const std::string& detail) {
        std::string msg = kind + ": " + file;
        if (row > 0) msg += ":" + std::to_string(row);
        if (!field.empty()) msg += ": field '" + field + "'";
        msg += ": " + detail;
        return msg;
    }

    std::string file_;
    size_t row_;
    std::string field_;
    std::string detail_;
};

// Malformed row or column in the orbit map or a usage table
class FormatError : public InputError {
public:
    FormatError(std::string file, size_t row, std::string field, std::string detail)
        : InputError("FormatError", std::move(file), row, std::move(field), std::move(detail)) {}
};

// Usage-table codon columns do not match the orbit map's codon domain
class SchemaMismatchError : public InputError {
public:
    SchemaMismatchError(std::string file, std::string field, std::string detail)
        : InputError("SchemaMismatchError", std::move(file), 0, std::move(field), std::move(detail)) {}
};

// Null distribution has zero variance (or no usable samples)
class DegenerateNullError : public std::runtime_error {
public:
    explicit DegenerateNullError(const std::string& what)
        : std::runtime_error("DegenerateNullError: " + what) {}
};

class RunCancelled : public std::runtime_error {
public:
    RunCancelled() : std::runtime_error("run cancelled") {}
};

} // namespace fcaudit
