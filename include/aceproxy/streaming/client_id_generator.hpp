// AceProxy - AceStream Multiplexing Proxy
// Client ID Generator - Process-wide unique PIDs for engine sessions

#ifndef ACEPROXY_STREAMING_CLIENT_ID_GENERATOR_HPP
#define ACEPROXY_STREAMING_CLIENT_ID_GENERATOR_HPP

#include <atomic>
#include <cstdint>
#include <string>

#include "aceproxy/core/types.hpp"

namespace aceproxy {
namespace streaming {

/**
 * @brief Generates "pid-<n>" identifiers from an atomic counter.
 *
 * The counter is seeded from the wall clock in nanoseconds so PIDs from a
 * restarted process do not collide with sessions the engine still holds.
 * Services draw from shared() so every PID is unique within the process.
 */
class ClientIdGenerator {
public:
    ClientIdGenerator();
    explicit ClientIdGenerator(uint64_t seed);

    ClientIdGenerator(const ClientIdGenerator&) = delete;
    ClientIdGenerator& operator=(const ClientIdGenerator&) = delete;

    /**
     * @brief The process-wide generator.
     */
    static ClientIdGenerator& shared();

    core::ClientId next();

private:
    std::atomic<uint64_t> counter_;
};

} // namespace streaming
} // namespace aceproxy

#endif // ACEPROXY_STREAMING_CLIENT_ID_GENERATOR_HPP
