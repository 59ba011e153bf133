// AceProxy - AceStream Multiplexing Proxy
// In-Memory Probe Repository Implementation

#include "aceproxy/storage/memory_probe_repository.hpp"

#include <algorithm>
#include <mutex>

namespace aceproxy {
namespace storage {

namespace {

// Newest first; equal timestamps keep the later insertion first.
std::vector<probe::ProbeResult> newestFirst(std::vector<probe::ProbeResult> results) {
    std::reverse(results.begin(), results.end());
    std::stable_sort(results.begin(), results.end(),
        [](const probe::ProbeResult& a, const probe::ProbeResult& b) {
            return a.timestamp() > b.timestamp();
        });
    return results;
}

} // namespace

core::Result<void, core::Error> MemoryProbeRepository::save(
    core::Context& ctx,
    const probe::ProbeResult& result)
{
    if (ctx.isDone()) {
        return core::Result<void, core::Error>::error(ctx.err());
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    results_.push_back(result);
    return core::Result<void, core::Error>::success();
}

core::Result<std::vector<probe::ProbeResult>, core::Error> MemoryProbeRepository::findByInfoHash(
    core::Context& ctx,
    const core::InfoHash& infoHash)
{
    return findByInfoHashSince(ctx, infoHash, core::WallTime::min());
}

core::Result<std::vector<probe::ProbeResult>, core::Error> MemoryProbeRepository::findByInfoHashSince(
    core::Context& ctx,
    const core::InfoHash& infoHash,
    core::WallTime since)
{
    using ResultType = core::Result<std::vector<probe::ProbeResult>, core::Error>;

    if (ctx.isDone()) {
        return ResultType::error(ctx.err());
    }

    std::vector<probe::ProbeResult> matches;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& result : results_) {
            if (result.infoHash() == infoHash && result.timestamp() >= since) {
                matches.push_back(result);
            }
        }
    }
    return ResultType::success(newestFirst(std::move(matches)));
}

core::Result<void, core::Error> MemoryProbeRepository::deleteBefore(core::Context& ctx, core::WallTime cutoff) {
    if (ctx.isDone()) {
        return core::Result<void, core::Error>::error(ctx.err());
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    results_.erase(
        std::remove_if(results_.begin(), results_.end(),
            [cutoff](const probe::ProbeResult& r) { return r.timestamp() < cutoff; }),
        results_.end());
    return core::Result<void, core::Error>::success();
}

core::Result<void, core::Error> MemoryProbeRepository::ping(core::Context& ctx) {
    if (ctx.isDone()) {
        return core::Result<void, core::Error>::error(ctx.err());
    }
    return core::Result<void, core::Error>::success();
}

size_t MemoryProbeRepository::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return results_.size();
}

} // namespace storage
} // namespace aceproxy
