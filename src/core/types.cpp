// AceProxy - AceStream Multiplexing Proxy
// Common type helpers

#include "aceproxy/core/types.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace aceproxy {
namespace core {

std::string trimWhitespace(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        start++;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        end--;
    }
    return s.substr(start, end - start);
}

std::string formatRfc3339(WallTime t) {
    auto timeT = SystemClock::to_time_t(t);
    std::tm tmBuf;
    gmtime_r(&timeT, &tmBuf);

    std::ostringstream oss;
    oss << std::put_time(&tmBuf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace core
} // namespace aceproxy
