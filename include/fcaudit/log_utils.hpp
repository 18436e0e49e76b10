#pragma once

// Formatting helpers for stderr narration.

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace fcaudit {
namespace log_utils {

// "850 ms", "12.4 s", "3m 05s", "2h 14m"
inline std::string format_duration_ms(int64_t ms) {
    if (ms < 0) ms = 0;
    std::ostringstream oss;
    if (ms < 1000) {
        oss << ms << " ms";
    } else if (ms < 60'000) {
        oss << std::fixed << std::setprecision(1) << static_cast<double>(ms) / 1000.0 << " s";
    } else if (ms < 3'600'000) {
        const int64_t s = ms / 1000;
        oss << s / 60 << "m " << std::setw(2) << std::setfill('0') << s % 60 << "s";
    } else {
        const int64_t m = ms / 60'000;
        oss << m / 60 << "h " << std::setw(2) << std::setfill('0') << m % 60 << "m";
    }
    return oss.str();
}

template <typename Clock, typename DurA, typename DurB>
inline std::string format_elapsed(const std::chrono::time_point<Clock, DurA>& start,
                                  const std::chrono::time_point<Clock, DurB>& end) {
    return format_duration_ms(
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count());
}

// "n/total (pct%)"
inline std::string format_progress(uint64_t done, uint64_t total) {
    std::ostringstream oss;
    oss << done << "/" << total;
    if (total > 0) {
        oss << " (" << std::fixed << std::setprecision(1)
            << 100.0 * static_cast<double>(done) / static_cast<double>(total) << "%)";
    }
    return oss.str();
}

}  // namespace log_utils
}  // namespace fcaudit
