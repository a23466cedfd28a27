#pragma once
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace a2a::core::config {

    // UTC time as ISO 8601 with millisecond precision, e.g. 2024-01-01T12:00:00.000Z
    inline std::string now_iso8601() {
        const auto now = std::chrono::system_clock::now();
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()) % 1000;
        const std::time_t seconds = std::chrono::system_clock::to_time_t(now);

        std::tm utc{};
        gmtime_r(&seconds, &utc);

        std::ostringstream ss;
        ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
           << std::setw(3) << std::setfill('0') << ms.count() << 'Z';
        return ss.str();
    }

} // namespace a2a::core::config
