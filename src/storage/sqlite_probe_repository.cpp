// AceProxy - AceStream Multiplexing Proxy
// SQLite Probe Repository Implementation

#include "aceproxy/storage/sqlite_probe_repository.hpp"

#include <sqlite3.h>

#include <chrono>
#include <limits>

namespace aceproxy {
namespace storage {

namespace {

const char* const kCategory = "ProbeStore";

const char* const kSchema =
    "CREATE TABLE IF NOT EXISTS probe_results ("
    "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  info_hash TEXT NOT NULL,"
    "  ts_ns INTEGER NOT NULL,"
    "  available INTEGER NOT NULL,"
    "  startup_latency_ns INTEGER NOT NULL,"
    "  peer_count INTEGER NOT NULL,"
    "  download_speed INTEGER NOT NULL,"
    "  status TEXT NOT NULL,"
    "  error_message TEXT NOT NULL"
    ");"
    "CREATE INDEX IF NOT EXISTS idx_probe_results_hash_ts"
    "  ON probe_results (info_hash, ts_ns);";

const char* const kInsert =
    "INSERT INTO probe_results"
    " (info_hash, ts_ns, available, startup_latency_ns, peer_count, download_speed, status, error_message)"
    " VALUES (?, ?, ?, ?, ?, ?, ?, ?);";

const char* const kSelectSince =
    "SELECT info_hash, ts_ns, available, startup_latency_ns, peer_count, download_speed, status, error_message"
    " FROM probe_results WHERE info_hash = ? AND ts_ns >= ?"
    " ORDER BY ts_ns DESC, id DESC;";

const char* const kDeleteBefore =
    "DELETE FROM probe_results WHERE ts_ns < ?;";

/**
 * @brief Owns one prepared statement.
 */
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : stmt_(nullptr) {
        rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
    }
    ~Statement() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return rc_ == SQLITE_OK && stmt_ != nullptr; }
    sqlite3_stmt* get() const { return stmt_; }

private:
    sqlite3_stmt* stmt_;
    int rc_;
};

int64_t toNanos(core::WallTime t) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(t.time_since_epoch()).count();
}

core::WallTime fromNanos(int64_t ns) {
    return core::WallTime(std::chrono::duration_cast<core::SystemClock::duration>(std::chrono::nanoseconds(ns)));
}

std::string columnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
}

} // namespace

// =============================================================================
// Lifecycle
// =============================================================================

core::Result<std::unique_ptr<SqliteProbeRepository>, core::Error> SqliteProbeRepository::open(
    const std::string& path,
    std::shared_ptr<core::StructuredLogger> logger)
{
    using ResultType = core::Result<std::unique_ptr<SqliteProbeRepository>, core::Error>;

    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        if (db) {
            sqlite3_close(db);
        }
        return ResultType::error(core::Error(
            core::ErrorCode::StorageOpenFailed, "failed to open database: " + message, path));
    }

    std::unique_ptr<SqliteProbeRepository> repository(
        new SqliteProbeRepository(db, path, std::move(logger)));

    auto schema = repository->initSchema();
    if (schema.isError()) {
        return ResultType::error(schema.error());
    }

    if (repository->logger_) {
        repository->logger_->info("Probe database opened at " + path, kCategory);
    }
    return ResultType::success(std::move(repository));
}

SqliteProbeRepository::SqliteProbeRepository(
    sqlite3* db,
    std::string path,
    std::shared_ptr<core::StructuredLogger> logger)
    : db_(db)
    , path_(std::move(path))
    , logger_(std::move(logger))
{
}

SqliteProbeRepository::~SqliteProbeRepository() {
    if (db_) {
        sqlite3_close(db_);
    }
}

core::Result<void, core::Error> SqliteProbeRepository::initSchema() {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_busy_timeout(db_, 5000);
    if (path_ != ":memory:") {
        sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    }

    char* errmsg = nullptr;
    if (sqlite3_exec(db_, kSchema, nullptr, nullptr, &errmsg) != SQLITE_OK) {
        std::string message = errmsg ? errmsg : "unknown error";
        sqlite3_free(errmsg);
        return core::Result<void, core::Error>::error(core::Error(
            core::ErrorCode::StorageQueryFailed, "failed to create schema: " + message, path_));
    }
    return core::Result<void, core::Error>::success();
}

// =============================================================================
// Repository Operations
// =============================================================================

core::Result<void, core::Error> SqliteProbeRepository::save(
    core::Context& ctx,
    const probe::ProbeResult& result)
{
    if (ctx.isDone()) {
        return core::Result<void, core::Error>::error(ctx.err());
    }

    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, kInsert);
    if (!stmt.ok()) {
        return core::Result<void, core::Error>::error(lastError("failed to prepare insert"));
    }

    sqlite3_bind_text(stmt.get(), 1, result.infoHash().c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt.get(), 2, toNanos(result.timestamp()));
    sqlite3_bind_int(stmt.get(), 3, result.available() ? 1 : 0);
    sqlite3_bind_int64(stmt.get(), 4, result.startupLatency().count());
    sqlite3_bind_int64(stmt.get(), 5, result.peerCount());
    sqlite3_bind_int64(stmt.get(), 6, result.downloadSpeed());
    sqlite3_bind_text(stmt.get(), 7, result.status().c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 8, result.errorMessage().c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return core::Result<void, core::Error>::error(lastError("failed to save probe result"));
    }
    return core::Result<void, core::Error>::success();
}

core::Result<std::vector<probe::ProbeResult>, core::Error> SqliteProbeRepository::findByInfoHash(
    core::Context& ctx,
    const core::InfoHash& infoHash)
{
    if (ctx.isDone()) {
        return core::Result<std::vector<probe::ProbeResult>, core::Error>::error(ctx.err());
    }
    return query(infoHash, std::numeric_limits<int64_t>::min());
}

core::Result<std::vector<probe::ProbeResult>, core::Error> SqliteProbeRepository::findByInfoHashSince(
    core::Context& ctx,
    const core::InfoHash& infoHash,
    core::WallTime since)
{
    if (ctx.isDone()) {
        return core::Result<std::vector<probe::ProbeResult>, core::Error>::error(ctx.err());
    }
    return query(infoHash, toNanos(since));
}

core::Result<void, core::Error> SqliteProbeRepository::deleteBefore(core::Context& ctx, core::WallTime cutoff) {
    if (ctx.isDone()) {
        return core::Result<void, core::Error>::error(ctx.err());
    }

    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, kDeleteBefore);
    if (!stmt.ok()) {
        return core::Result<void, core::Error>::error(lastError("failed to prepare delete"));
    }
    sqlite3_bind_int64(stmt.get(), 1, toNanos(cutoff));

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return core::Result<void, core::Error>::error(lastError("failed to delete probe results"));
    }

    int removed = sqlite3_changes(db_);
    if (removed > 0 && logger_) {
        logger_->debug("Deleted " + std::to_string(removed) + " expired probe results", kCategory);
    }
    return core::Result<void, core::Error>::success();
}

core::Result<void, core::Error> SqliteProbeRepository::ping(core::Context& ctx) {
    if (ctx.isDone()) {
        return core::Result<void, core::Error>::error(ctx.err());
    }

    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, "SELECT 1;");
    if (!stmt.ok() || sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return core::Result<void, core::Error>::error(lastError("database ping failed"));
    }
    return core::Result<void, core::Error>::success();
}

// =============================================================================
// Helpers
// =============================================================================

core::Result<std::vector<probe::ProbeResult>, core::Error> SqliteProbeRepository::query(
    const core::InfoHash& infoHash,
    int64_t sinceNs)
{
    using ResultType = core::Result<std::vector<probe::ProbeResult>, core::Error>;

    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, kSelectSince);
    if (!stmt.ok()) {
        return ResultType::error(lastError("failed to prepare query"));
    }
    sqlite3_bind_text(stmt.get(), 1, infoHash.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt.get(), 2, sinceNs);

    std::vector<probe::ProbeResult> results;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        results.push_back(probe::ProbeResult::reconstruct(
            columnText(stmt.get(), 0),
            fromNanos(sqlite3_column_int64(stmt.get(), 1)),
            sqlite3_column_int(stmt.get(), 2) != 0,
            std::chrono::nanoseconds(sqlite3_column_int64(stmt.get(), 3)),
            sqlite3_column_int64(stmt.get(), 4),
            sqlite3_column_int64(stmt.get(), 5),
            columnText(stmt.get(), 6),
            columnText(stmt.get(), 7)));
    }

    if (rc != SQLITE_DONE) {
        return ResultType::error(lastError("failed to read probe results"));
    }
    return ResultType::success(std::move(results));
}

core::Error SqliteProbeRepository::lastError(const std::string& what) const {
    return core::Error(core::ErrorCode::StorageQueryFailed, what + ": " + sqlite3_errmsg(db_), path_);
}

} // namespace storage
} // namespace aceproxy
