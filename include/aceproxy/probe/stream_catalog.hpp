// AceProxy - AceStream Multiplexing Proxy
// Stream Catalog - Known streams and the channels they belong to

#ifndef ACEPROXY_PROBE_STREAM_CATALOG_HPP
#define ACEPROXY_PROBE_STREAM_CATALOG_HPP

#include <shared_mutex>
#include <string>
#include <vector>

#include "aceproxy/core/context.hpp"
#include "aceproxy/core/error_codes.hpp"
#include "aceproxy/core/result.hpp"
#include "aceproxy/core/types.hpp"

namespace aceproxy {
namespace probe {

/**
 * @brief One catalogued stream.
 */
struct StreamEntry {
    core::InfoHash infoHash;
    std::string channelName;
};

/**
 * @brief Read-only port to the stream catalog.
 */
class IStreamCatalog {
public:
    virtual ~IStreamCatalog() = default;

    virtual core::Result<std::vector<StreamEntry>, core::Error> findAll(core::Context& ctx) = 0;

    virtual core::Result<std::vector<StreamEntry>, core::Error> findByChannelName(
        core::Context& ctx,
        const std::string& channelName
    ) = 0;
};

/**
 * @brief Catalog held in memory, typically loaded from configuration.
 *
 * Entries with an empty infohash are ignored; a repeated infohash keeps
 * its first channel.
 */
class InMemoryStreamCatalog : public IStreamCatalog {
public:
    InMemoryStreamCatalog() = default;
    explicit InMemoryStreamCatalog(const std::vector<StreamEntry>& entries);

    void add(const StreamEntry& entry);
    size_t size() const;

    core::Result<std::vector<StreamEntry>, core::Error> findAll(core::Context& ctx) override;

    core::Result<std::vector<StreamEntry>, core::Error> findByChannelName(
        core::Context& ctx,
        const std::string& channelName
    ) override;

private:
    mutable std::shared_mutex mutex_;
    std::vector<StreamEntry> entries_;
};

} // namespace probe
} // namespace aceproxy

#endif // ACEPROXY_PROBE_STREAM_CATALOG_HPP
