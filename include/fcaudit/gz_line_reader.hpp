#pragma once
// Line reader over zlib.
//
// gzopen reads uncompressed files transparently, so every text input (orbit
// maps, usage tables, plain or .gz) goes through this one class.

#include <cstddef>
#include <memory>
#include <string>

namespace fcaudit {

class GzLineReader {
public:
    static constexpr size_t GZBUF_SIZE = 4 * 1024 * 1024;  // 4 MB

    // Throws std::runtime_error when the file cannot be opened.
    explicit GzLineReader(const std::string& path);
    ~GzLineReader();

    GzLineReader(const GzLineReader&) = delete;
    GzLineReader& operator=(const GzLineReader&) = delete;

    // Read one line (without trailing "\n" or "\r\n") into `line`.
    // Returns false on EOF. Throws std::runtime_error on a decompression error.
    bool readline(std::string& line);

    // 1-based number of the line most recently returned by readline()
    size_t line_number() const { return line_number_; }

    const std::string& path() const { return path_; }

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
    std::string path_;
    size_t line_number_ = 0;
};

} // namespace fcaudit
