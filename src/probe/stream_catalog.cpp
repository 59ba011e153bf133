// AceProxy - AceStream Multiplexing Proxy
// In-Memory Stream Catalog Implementation

#include "aceproxy/probe/stream_catalog.hpp"

#include <algorithm>
#include <mutex>

namespace aceproxy {
namespace probe {

InMemoryStreamCatalog::InMemoryStreamCatalog(const std::vector<StreamEntry>& entries) {
    for (const auto& entry : entries) {
        add(entry);
    }
}

void InMemoryStreamCatalog::add(const StreamEntry& entry) {
    StreamEntry normalized{core::trimWhitespace(entry.infoHash), core::trimWhitespace(entry.channelName)};
    if (normalized.infoHash.empty()) {
        return;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto existing = std::find_if(entries_.begin(), entries_.end(),
        [&](const StreamEntry& e) { return e.infoHash == normalized.infoHash; });
    if (existing == entries_.end()) {
        entries_.push_back(std::move(normalized));
    }
}

size_t InMemoryStreamCatalog::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

core::Result<std::vector<StreamEntry>, core::Error> InMemoryStreamCatalog::findAll(core::Context& ctx) {
    if (ctx.isDone()) {
        return core::Result<std::vector<StreamEntry>, core::Error>::error(ctx.err());
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);
    return core::Result<std::vector<StreamEntry>, core::Error>::success(entries_);
}

core::Result<std::vector<StreamEntry>, core::Error> InMemoryStreamCatalog::findByChannelName(
    core::Context& ctx,
    const std::string& channelName)
{
    if (ctx.isDone()) {
        return core::Result<std::vector<StreamEntry>, core::Error>::error(ctx.err());
    }

    std::vector<StreamEntry> matches;
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& entry : entries_) {
        if (entry.channelName == channelName) {
            matches.push_back(entry);
        }
    }
    return core::Result<std::vector<StreamEntry>, core::Error>::success(std::move(matches));
}

} // namespace probe
} // namespace aceproxy
