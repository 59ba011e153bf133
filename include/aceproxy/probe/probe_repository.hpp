// AceProxy - AceStream Multiplexing Proxy
// Probe Repository Port - Persistence of probe results

#ifndef ACEPROXY_PROBE_PROBE_REPOSITORY_HPP
#define ACEPROXY_PROBE_PROBE_REPOSITORY_HPP

#include <vector>

#include "aceproxy/core/context.hpp"
#include "aceproxy/core/error_codes.hpp"
#include "aceproxy/core/result.hpp"
#include "aceproxy/core/types.hpp"
#include "aceproxy/probe/probe_result.hpp"

namespace aceproxy {
namespace probe {

/**
 * @brief Storage port for probe results.
 *
 * Implementations must be safe to call from several threads. Queries
 * return results newest first.
 */
class IProbeRepository {
public:
    virtual ~IProbeRepository() = default;

    virtual core::Result<void, core::Error> save(core::Context& ctx, const ProbeResult& result) = 0;

    virtual core::Result<std::vector<ProbeResult>, core::Error> findByInfoHash(
        core::Context& ctx,
        const core::InfoHash& infoHash
    ) = 0;

    /**
     * @brief Results with timestamp >= @p since, newest first.
     */
    virtual core::Result<std::vector<ProbeResult>, core::Error> findByInfoHashSince(
        core::Context& ctx,
        const core::InfoHash& infoHash,
        core::WallTime since
    ) = 0;

    /**
     * @brief Delete results with timestamp strictly before @p cutoff.
     */
    virtual core::Result<void, core::Error> deleteBefore(core::Context& ctx, core::WallTime cutoff) = 0;

    /**
     * @brief Verify the store is reachable.
     */
    virtual core::Result<void, core::Error> ping(core::Context& ctx) = 0;
};

} // namespace probe
} // namespace aceproxy

#endif // ACEPROXY_PROBE_PROBE_REPOSITORY_HPP
