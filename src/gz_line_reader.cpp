#include "fcaudit/gz_line_reader.hpp"

#include <cstring>
#include <stdexcept>
#include <zlib.h>

namespace fcaudit {

class GzLineReader::Impl {
public:
    gzFile gz_file_ = nullptr;
    char buffer_[65536];  // Line buffer (separate from I/O buffer)

    ~Impl() {
        if (gz_file_) gzclose(gz_file_);
    }

    bool open(const std::string& filename) {
        gz_file_ = gzopen(filename.c_str(), "rb");
        if (!gz_file_) return false;
        gzbuffer(gz_file_, GZBUF_SIZE);
        return true;
    }

    // Lines longer than the buffer arrive in several gzgets() pieces
    bool getline(std::string& line) {
        line.clear();
        bool got_any = false;
        while (gzgets(gz_file_, buffer_, sizeof(buffer_)) != nullptr) {
            got_any = true;
            size_t len = strlen(buffer_);
            if (len > 0 && buffer_[len - 1] == '\n') {
                line.append(buffer_, len - 1);
                if (!line.empty() && line.back() == '\r') line.pop_back();
                return true;
            }
            line.append(buffer_, len);
        }
        int errnum = Z_OK;
        const char* msg = gzerror(gz_file_, &errnum);
        if (errnum != Z_OK && errnum != Z_STREAM_END) {
            throw std::runtime_error(std::string("Decompression error: ") + (msg ? msg : "unknown"));
        }
        if (!line.empty() && line.back() == '\r') line.pop_back();
        return got_any;
    }
};

GzLineReader::GzLineReader(const std::string& path)
    : impl_(std::make_unique<Impl>()), path_(path) {
    if (!impl_->open(path)) {
        throw std::runtime_error("Failed to open file: " + path);
    }
}

GzLineReader::~GzLineReader() = default;

bool GzLineReader::readline(std::string& line) {
    try {
        if (!impl_->getline(line)) return false;
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(path_ + ": " + e.what());
    }
    ++line_number_;
    return true;
}

} // namespace fcaudit
