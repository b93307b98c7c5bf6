#pragma once

#include <chrono>
#include <ctime>
#include <string>

namespace sp::util {

using Clock = std::chrono::system_clock;
using Timestamp = std::chrono::time_point<Clock, std::chrono::microseconds>;

inline Timestamp now() {
    return std::chrono::time_point_cast<std::chrono::microseconds>(Clock::now());
}

// ISO 8601 UTC with microseconds, e.g. "2025-03-01T12:00:00.000042Z"
std::string timestampToString(Timestamp ts);

// Inverse of timestampToString; the fractional part is optional.
Timestamp parseTimestamp(const std::string& iso);

}
