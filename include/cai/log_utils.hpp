#pragma once

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace cai {
namespace log_utils {

inline std::string format_duration_ms(int64_t ms) {
    if (ms < 0) ms = 0;
    if (ms < 1000) {
        return std::to_string(ms) + " ms";
    }

    const int64_t total_seconds = ms / 1000;
    if (total_seconds < 60) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1)
            << (static_cast<double>(ms) / 1000.0) << " s";
        return oss.str();
    }

    const int64_t minutes = total_seconds / 60;
    return std::to_string(minutes) + "m " + std::to_string(total_seconds % 60) + "s";
}

template <typename Clock, typename DurA, typename DurB>
inline std::string format_elapsed(
    const std::chrono::time_point<Clock, DurA>& start,
    const std::chrono::time_point<Clock, DurB>& end) {
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    return format_duration_ms(ms);
}

// Human-readable count: 950, 12.3K, 4.1M
inline std::string format_count(uint64_t n) {
    if (n < 1000) return std::to_string(n);
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);
    if (n < 1000000) {
        oss << (static_cast<double>(n) / 1e3) << "K";
    } else {
        oss << (static_cast<double>(n) / 1e6) << "M";
    }
    return oss.str();
}

}  // namespace log_utils
}  // namespace cai
