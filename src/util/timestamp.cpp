#include "util/timestamp.hpp"

#include <cstdio>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace sp::util {

std::string timestampToString(const Timestamp ts) {
    using namespace std::chrono;

    const auto secs = floor<seconds>(ts);
    const auto micros = duration_cast<microseconds>(ts - secs).count();
    const std::time_t t = Clock::to_time_t(secs);

    std::tm tm{};
    gmtime_r(&t, &tm);

    char frac[8];
    std::snprintf(frac, sizeof(frac), "%06lld", static_cast<long long>(micros));

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << frac << 'Z';
    return oss.str();
}

Timestamp parseTimestamp(const std::string& iso) {
    using namespace std::chrono;

    std::tm tm = {};
    std::istringstream ss(iso.substr(0, 19)); // "YYYY-MM-DDTHH:MM:SS"
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) throw std::runtime_error("Failed to parse timestamp: " + iso);

    long long micros = 0;
    if (iso.size() > 20 && iso[19] == '.') {
        const auto end = iso.find('Z', 20);
        auto digits = iso.substr(20, end == std::string::npos ? std::string::npos : end - 20);
        if (digits.empty() || digits.size() > 6 || digits.find_first_not_of("0123456789") != std::string::npos)
            throw std::runtime_error("Failed to parse timestamp fraction: " + iso);
        digits.append(6 - digits.size(), '0');
        micros = std::stoll(digits);
    }

    const auto secs = Clock::from_time_t(timegm(&tm));
    return time_point_cast<microseconds>(secs) + microseconds(micros);
}

}
