#pragma once

#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace tfs::util {

// ISO 8601 UTC. A time_t outside the calendar range comes back as its plain seconds count.
inline std::string timestampToString(const std::time_t ts) {
    std::tm tm{};
    if (!gmtime_r(&ts, &tm)) return std::to_string(ts);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

}
