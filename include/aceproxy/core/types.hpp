// AceProxy - AceStream Multiplexing Proxy
// Common type definitions

#ifndef ACEPROXY_CORE_TYPES_HPP
#define ACEPROXY_CORE_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace aceproxy {
namespace core {

// Identifiers are opaque strings handed to us by clients or the engine.
using ContentId = std::string;
using ClientId = std::string;
using InfoHash = std::string;

using SteadyClock = std::chrono::steady_clock;
using SystemClock = std::chrono::system_clock;
using TimePoint = SteadyClock::time_point;
using WallTime = SystemClock::time_point;
using Duration = std::chrono::milliseconds;

/**
 * @brief Immutable block of bytes relayed from the engine to clients.
 */
using Chunk = std::vector<uint8_t>;

/**
 * @brief Client connection details used for request logging.
 */
struct ClientInfo {
    std::string ip;
    uint16_t port = 0;
    std::string userAgent;
};

/**
 * @brief Trim leading and trailing ASCII whitespace.
 */
std::string trimWhitespace(const std::string& s);

/**
 * @brief Format a wall-clock time as RFC 3339 UTC ("2024-01-02T03:04:05Z").
 */
std::string formatRfc3339(WallTime t);

} // namespace core
} // namespace aceproxy

#endif // ACEPROXY_CORE_TYPES_HPP
