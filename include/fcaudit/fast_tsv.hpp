#pragma once
/**
 * @file fast_tsv.hpp
 * @brief Zero-copy field splitting and strict numeric parsing for delimited text
 */

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <string_view>
#include <system_error>
#include <vector>

namespace fcaudit {

/**
 * @brief Split a line into fields on `delim` (string_views into `line`)
 *
 * Empty fields are kept, so "a\t\tb" yields three fields.
 */
inline void split_fields(std::string_view line, char delim, std::vector<std::string_view>& fields) {
    fields.clear();
    const char* p = line.data();
    const char* end = line.data() + line.size();
    while (true) {
        const char* sep = static_cast<const char*>(
            memchr(p, delim, static_cast<size_t>(end - p)));
        if (!sep) {
            fields.emplace_back(p, static_cast<size_t>(end - p));
            return;
        }
        fields.emplace_back(p, static_cast<size_t>(sep - p));
        p = sep + 1;
    }
}

/**
 * @brief Split on runs of blanks (space or tab), dropping empty fields
 */
inline void split_whitespace(std::string_view line, std::vector<std::string_view>& fields) {
    fields.clear();
    size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) ++i;
        size_t start = i;
        while (i < line.size() && line[i] != ' ' && line[i] != '\t') ++i;
        if (i > start) fields.push_back(line.substr(start, i - start));
    }
}

inline std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

inline bool is_blank_line(std::string_view s) {
    return trim(s).empty();
}

/**
 * @brief Strict string to double: the whole (trimmed) field must parse
 *
 * Returns false for empty fields and trailing garbage. Non-finite values
 * ("inf", "nan") parse successfully; callers decide whether to accept them.
 */
inline bool parse_double(std::string_view s, double& out) {
    s = trim(s);
    if (s.empty()) return false;
    if (s.front() == '+') {
        s.remove_prefix(1);
        if (s.empty() || s.front() == '-') return false;
    }
    const char* first = s.data();
    const char* last = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

/**
 * @brief Strict string to int64 (decimal, optional sign)
 */
inline bool parse_int64(std::string_view s, int64_t& out) {
    s = trim(s);
    if (s.empty()) return false;
    if (s.front() == '+') {
        s.remove_prefix(1);
        if (s.empty() || s.front() == '-') return false;
    }
    const char* first = s.data();
    const char* last = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

} // namespace fcaudit
