// AceProxy - AceStream Multiplexing Proxy
// SQLite Probe Repository - Durable probe result storage
//
// Responsibilities:
// - Create the probe_results schema on first open
// - Persist results with nanosecond timestamps
// - Serve windowed queries newest first through the (info_hash, ts_ns) index
// - Expire results strictly older than a cutoff

#ifndef ACEPROXY_STORAGE_SQLITE_PROBE_REPOSITORY_HPP
#define ACEPROXY_STORAGE_SQLITE_PROBE_REPOSITORY_HPP

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "aceproxy/core/structured_logger.hpp"
#include "aceproxy/probe/probe_repository.hpp"

struct sqlite3;

namespace aceproxy {
namespace storage {

/**
 * @brief IProbeRepository backed by one SQLite connection.
 *
 * Statements run under a single mutex; the connection is never shared
 * across threads unguarded.
 */
class SqliteProbeRepository : public probe::IProbeRepository {
public:
    /**
     * @brief Open (or create) the database and ensure the schema exists.
     *
     * @param path File path, or ":memory:" for a private in-memory database
     * @return StorageOpenFailed or StorageQueryFailed on failure
     */
    static core::Result<std::unique_ptr<SqliteProbeRepository>, core::Error> open(
        const std::string& path,
        std::shared_ptr<core::StructuredLogger> logger = nullptr
    );

    ~SqliteProbeRepository() override;

    SqliteProbeRepository(const SqliteProbeRepository&) = delete;
    SqliteProbeRepository& operator=(const SqliteProbeRepository&) = delete;

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

    const std::string& path() const { return path_; }

private:
    SqliteProbeRepository(sqlite3* db, std::string path, std::shared_ptr<core::StructuredLogger> logger);

    core::Result<void, core::Error> initSchema();

    core::Result<std::vector<probe::ProbeResult>, core::Error> query(
        const core::InfoHash& infoHash,
        int64_t sinceNs
    );

    core::Error lastError(const std::string& what) const;

    sqlite3* db_;
    const std::string path_;
    std::shared_ptr<core::StructuredLogger> logger_;
    std::mutex mutex_;
};

} // namespace storage
} // namespace aceproxy

#endif // ACEPROXY_STORAGE_SQLITE_PROBE_REPOSITORY_HPP
