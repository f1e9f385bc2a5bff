/**
 * @file Timestamp.hpp
 * @brief Millisecond-precision wall clock time used by every record.
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace deskpal::domain {

/// Wall clock instant, truncated to milliseconds so it survives a round trip to disk unchanged.
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

inline Timestamp Now() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

inline std::int64_t ToEpochMillis(Timestamp ts) {
    return ts.time_since_epoch().count();
}

inline Timestamp FromEpochMillis(std::int64_t millis) {
    return Timestamp(std::chrono::milliseconds(millis));
}

} // namespace deskpal::domain
