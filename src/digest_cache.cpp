#include "sift/digest_cache.h"

#include "sift/logger.h"
#include "sift/perf.h"

#include <sqlite3.h>

#include <chrono>
#include <system_error>

namespace sift {

namespace fs = std::filesystem;

namespace {

void FinalizeSqlite(sqlite3_stmt* stmt)
{
    if (stmt) {
        sqlite3_finalize(stmt);
    }
}

using SqliteStmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&FinalizeSqlite)>;

constexpr std::string_view kSchema =
    "CREATE TABLE IF NOT EXISTS Digests ("
    "path TEXT NOT NULL,"
    "algorithm TEXT NOT NULL,"
    "size INTEGER NOT NULL,"
    "mtime_ns INTEGER NOT NULL,"
    "digest TEXT NOT NULL,"
    "PRIMARY KEY (path, algorithm));";

sqlite3_int64 ToNanoseconds(fs::file_time_type mtime)
{
    return static_cast<sqlite3_int64>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(mtime.time_since_epoch()).count());
}

SqliteStmtPtr Prepare(sqlite3* db, std::string_view sql)
{
    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()), &raw, nullptr);
    if (rc != SQLITE_OK) {
        Logger::instance().warn("digest cache: prepare failed: {}", sqlite3_errmsg(db));
        FinalizeSqlite(raw);
        return {nullptr, &FinalizeSqlite};
    }
    return {raw, &FinalizeSqlite};
}

}  // namespace

std::unique_ptr<DigestCache> DigestCache::Open(const fs::path& path)
{
    perf::Timer timer("digest_cache::open");
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            Logger::instance().warn("digest cache: cannot create {}: {}",
                                    path.parent_path().string(), ec.message());
            return nullptr;
        }
    }

    sqlite3* raw = nullptr;
    const std::string open_path = path.string();
    int rc = sqlite3_open_v2(open_path.c_str(), &raw,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        Logger::instance().warn("digest cache: failed to open '{}': {}", open_path,
                                raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc));
        if (raw) sqlite3_close(raw);
        return nullptr;
    }

    std::unique_ptr<DigestCache> cache(new DigestCache(raw, path));
    if (!cache->Execute(kSchema)) {
        return nullptr;
    }
    Logger::instance().debug("digest cache: using {}", open_path);
    return cache;
}

DigestCache::DigestCache(sqlite3* db, fs::path path)
    : db_(db),
      path_(std::move(path)) {}

DigestCache::~DigestCache()
{
    if (db_) {
        sqlite3_close(db_);
    }
}

bool DigestCache::Execute(std::string_view sql)
{
    char* err_msg = nullptr;
    std::string statement(sql);
    int rc = sqlite3_exec(db_, statement.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        Logger::instance().warn("digest cache: {}", err_msg ? err_msg : sqlite3_errmsg(db_));
        if (err_msg) {
            sqlite3_free(err_msg);
        }
        return false;
    }
    return true;
}

std::optional<std::string> DigestCache::Lookup(const fs::path& path,
                                               DigestAlgorithm algorithm,
                                               std::uintmax_t size,
                                               fs::file_time_type mtime)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto& perf_manager = perf::Manager::Instance();
    SqliteStmtPtr stmt = Prepare(db_,
        "SELECT size, mtime_ns, digest FROM Digests WHERE path = ?1 AND algorithm = ?2;");
    if (!stmt) {
        return std::nullopt;
    }

    const std::string key = path.string();
    const std::string algo(ToString(algorithm));
    sqlite3_bind_text(stmt.get(), 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, algo.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        const auto cached_size = static_cast<std::uintmax_t>(sqlite3_column_int64(stmt.get(), 0));
        const sqlite3_int64 cached_mtime = sqlite3_column_int64(stmt.get(), 1);
        const unsigned char* text = sqlite3_column_text(stmt.get(), 2);
        if (cached_size == size && cached_mtime == ToNanoseconds(mtime) && text != nullptr) {
            perf_manager.IncrementCounter("digest_cache::hits");
            return std::string(reinterpret_cast<const char*>(text));
        }
        perf_manager.IncrementCounter("digest_cache::stale");
        return std::nullopt;
    }
    if (rc != SQLITE_DONE) {
        Logger::instance().warn("digest cache: lookup failed: {}", sqlite3_errmsg(db_));
    }
    perf_manager.IncrementCounter("digest_cache::misses");
    return std::nullopt;
}

void DigestCache::Store(const fs::path& path,
                        DigestAlgorithm algorithm,
                        std::uintmax_t size,
                        fs::file_time_type mtime,
                        const std::string& digest)
{
    std::lock_guard<std::mutex> lock(mutex_);
    SqliteStmtPtr stmt = Prepare(db_,
        "INSERT OR REPLACE INTO Digests (path, algorithm, size, mtime_ns, digest) "
        "VALUES (?1, ?2, ?3, ?4, ?5);");
    if (!stmt) {
        return;
    }

    const std::string key = path.string();
    const std::string algo(ToString(algorithm));
    sqlite3_bind_text(stmt.get(), 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, algo.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt.get(), 3, static_cast<sqlite3_int64>(size));
    sqlite3_bind_int64(stmt.get(), 4, ToNanoseconds(mtime));
    sqlite3_bind_text(stmt.get(), 5, digest.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        Logger::instance().warn("digest cache: store failed for {}: {}", key, sqlite3_errmsg(db_));
        return;
    }
    perf::Manager::Instance().IncrementCounter("digest_cache::stores");
}

std::uint64_t DigestCache::size()
{
    std::lock_guard<std::mutex> lock(mutex_);
    SqliteStmtPtr stmt = Prepare(db_, "SELECT COUNT(*) FROM Digests;");
    if (!stmt || sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return 0;
    }
    return static_cast<std::uint64_t>(sqlite3_column_int64(stmt.get(), 0));
}

} // namespace sift
