#pragma once

#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace pfs::util {

// put.io reports "2016-07-15T08:53:37" (UTC, no zone suffix). Unparseable input yields 0.
inline std::time_t parseApiTimestamp(const std::string& iso) {
    if (iso.size() < 19) return 0;
    std::tm tm = {};
    std::istringstream ss(iso.substr(0, 19));
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) return 0;
    return timegm(&tm);
}

inline std::string timestampToString(const std::time_t ts) {
    std::tm tm{};
    gmtime_r(&ts, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

} // namespace pfs::util
