// AceProxy - AceStream Multiplexing Proxy
// In-Memory Probe Repository - Volatile probe result storage

#ifndef ACEPROXY_STORAGE_MEMORY_PROBE_REPOSITORY_HPP
#define ACEPROXY_STORAGE_MEMORY_PROBE_REPOSITORY_HPP

#include <shared_mutex>
#include <vector>

#include "aceproxy/probe/probe_repository.hpp"

namespace aceproxy {
namespace storage {

/**
 * @brief IProbeRepository kept in process memory.
 *
 * Used when no database path is configured and by tests. ping() always
 * succeeds.
 */
class MemoryProbeRepository : public probe::IProbeRepository {
public:
    MemoryProbeRepository() = default;

    core::Result<void, core::Error> save(core::Context& ctx, const probe::ProbeResult& result) override;

    core::Result<std::vector<probe::ProbeResult>, core::Error> findByInfoHash(
        core::Context& ctx,
        const core::InfoHash& infoHash
    ) override;

    core::Result<std::vector<probe::ProbeResult>, core::Error> findByInfoHashSince(
        core::Context& ctx,
        const core::InfoHash& infoHash,
        core::WallTime since
    ) override;

    core::Result<void, core::Error> deleteBefore(core::Context& ctx, core::WallTime cutoff) override;

    core::Result<void, core::Error> ping(core::Context& ctx) override;

    size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::vector<probe::ProbeResult> results_;   ///< Insertion order
};

} // namespace storage
} // namespace aceproxy

#endif // ACEPROXY_STORAGE_MEMORY_PROBE_REPOSITORY_HPP
