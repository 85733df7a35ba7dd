#include <ragcore/cache/sqlite_cache_backend.h>

#include <spdlog/spdlog.h>

#include <span>

namespace ragcore::cache {

namespace {

constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS cache_entries (
    cache_key TEXT PRIMARY KEY,
    label TEXT NOT NULL DEFAULT '',
    value BLOB NOT NULL,
    hit_count INTEGER NOT NULL DEFAULT 0,
    created_at INTEGER NOT NULL,
    expires_at INTEGER NOT NULL,
    last_accessed_at INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_cache_entries_expires ON cache_entries(expires_at);
CREATE INDEX IF NOT EXISTS idx_cache_entries_accessed ON cache_entries(last_accessed_at);
CREATE INDEX IF NOT EXISTS idx_cache_entries_hits ON cache_entries(hit_count DESC);
)sql";

std::span<const std::byte> asBytes(const std::string& value) {
    return std::as_bytes(std::span<const char>(value.data(), value.size()));
}

Error unavailable() {
    return Error{ErrorCode::CacheTierUnavailable, "sqlite cache is not open"};
}

} // namespace

SqliteCacheBackend::SqliteCacheBackend(std::filesystem::path path, size_t capacity,
                                       WallClockFn clock)
    : path_(std::move(path)), capacity_(capacity == 0 ? 1 : capacity), clock_(std::move(clock)) {}

SqliteCacheBackend::~SqliteCacheBackend() {
    close();
}

int64_t SqliteCacheBackend::nowMillis() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(clock_().time_since_epoch())
        .count();
}

Result<void> SqliteCacheBackend::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_.isOpen()) {
        return {};
    }

    const bool inMemory = path_.empty() || path_ == ":memory:";
    if (inMemory) {
        if (auto r = db_.open(":memory:", storage::ConnectionMode::Memory); !r) {
            return r;
        }
    } else {
        std::error_code ec;
        if (path_.has_parent_path()) {
            std::filesystem::create_directories(path_.parent_path(), ec);
            if (ec) {
                return Error{ErrorCode::CacheTierUnavailable,
                             "Cannot create cache directory: " + ec.message()};
            }
        }
        if (auto r = db_.open(path_.string(), storage::ConnectionMode::Create); !r) {
            return r;
        }
        if (auto r = db_.enableWAL(); !r) {
            spdlog::warn("WAL unavailable for {}: {}", path_.string(), r.error().message);
        }
    }

    if (auto r = createSchema(); !r) {
        db_.close();
        return r;
    }
    return {};
}

void SqliteCacheBackend::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    db_.close();
}

Result<void> SqliteCacheBackend::createSchema() {
    return db_.execute(kSchema);
}

Result<std::optional<std::string>> SqliteCacheBackend::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_.isOpen()) {
        return unavailable();
    }

    auto stmtResult = db_.prepare("SELECT value, expires_at FROM cache_entries WHERE cache_key = ?");
    if (!stmtResult) {
        return stmtResult.error();
    }
    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, key); !r) {
        return r.error();
    }
    auto row = stmt.step();
    if (!row) {
        return row.error();
    }
    if (!row.value()) {
        return std::optional<std::string>{};
    }

    const int64_t now = nowMillis();
    auto blob = stmt.getBlob(0);
    const int64_t expiresAt = stmt.getInt64(1);

    if (expiresAt <= now) {
        auto del = db_.prepare("DELETE FROM cache_entries WHERE cache_key = ?");
        if (!del) {
            return del.error();
        }
        auto delStmt = std::move(del).value();
        if (auto r = delStmt.bind(1, key); !r) {
            return r.error();
        }
        if (auto r = delStmt.execute(); !r) {
            return r.error();
        }
        return std::optional<std::string>{};
    }

    auto touch = db_.prepare("UPDATE cache_entries SET hit_count = hit_count + 1, "
                             "last_accessed_at = ? WHERE cache_key = ?");
    if (!touch) {
        return touch.error();
    }
    auto touchStmt = std::move(touch).value();
    if (auto r = touchStmt.bindAll(now, key); !r) {
        return r.error();
    }
    if (auto r = touchStmt.execute(); !r) {
        return r.error();
    }

    std::string value(reinterpret_cast<const char*>(blob.data()), blob.size());
    return std::optional<std::string>{std::move(value)};
}

Result<void> SqliteCacheBackend::set(const std::string& key, const std::string& value,
                                     std::chrono::milliseconds ttl, const std::string& label) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_.isOpen()) {
        return unavailable();
    }

    const int64_t now = nowMillis();
    auto stmtResult = db_.prepare(
        "INSERT INTO cache_entries (cache_key, label, value, hit_count, created_at, expires_at, "
        "last_accessed_at) VALUES (?, ?, ?, 0, ?, ?, ?) "
        "ON CONFLICT(cache_key) DO UPDATE SET label = excluded.label, value = excluded.value, "
        "created_at = excluded.created_at, expires_at = excluded.expires_at, "
        "last_accessed_at = excluded.last_accessed_at");
    if (!stmtResult) {
        return stmtResult.error();
    }
    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bindAll(key, label, asBytes(value), now, now + ttl.count(), now); !r) {
        return r;
    }
    if (auto r = stmt.execute(); !r) {
        return r;
    }
    return enforceCapacity();
}

Result<void> SqliteCacheBackend::enforceCapacity() {
    auto countResult = db_.prepare("SELECT COUNT(*) FROM cache_entries");
    if (!countResult) {
        return countResult.error();
    }
    auto countStmt = std::move(countResult).value();
    auto row = countStmt.step();
    if (!row) {
        return row.error();
    }
    const int64_t count = row.value() ? countStmt.getInt64(0) : 0;
    const auto capacity = static_cast<int64_t>(capacity_);
    if (count <= capacity) {
        return {};
    }

    auto evict = db_.prepare("DELETE FROM cache_entries WHERE cache_key IN ("
                             "SELECT cache_key FROM cache_entries "
                             "ORDER BY last_accessed_at ASC, cache_key ASC LIMIT ?)");
    if (!evict) {
        return evict.error();
    }
    auto evictStmt = std::move(evict).value();
    if (auto r = evictStmt.bind(1, count - capacity); !r) {
        return r;
    }
    return evictStmt.execute();
}

Result<void> SqliteCacheBackend::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_.isOpen()) {
        return unavailable();
    }
    auto stmtResult = db_.prepare("DELETE FROM cache_entries WHERE cache_key = ?");
    if (!stmtResult) {
        return stmtResult.error();
    }
    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, key); !r) {
        return r;
    }
    return stmt.execute();
}

Result<size_t> SqliteCacheBackend::removePrefix(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_.isOpen()) {
        return unavailable();
    }
    auto stmtResult =
        db_.prepare("DELETE FROM cache_entries WHERE substr(cache_key, 1, length(?1)) = ?1");
    if (!stmtResult) {
        return stmtResult.error();
    }
    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, prefix); !r) {
        return r.error();
    }
    if (auto r = stmt.execute(); !r) {
        return r.error();
    }
    return static_cast<size_t>(db_.changes());
}

Result<size_t> SqliteCacheBackend::clearExpired() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_.isOpen()) {
        return unavailable();
    }
    auto stmtResult = db_.prepare("DELETE FROM cache_entries WHERE expires_at <= ?");
    if (!stmtResult) {
        return stmtResult.error();
    }
    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, nowMillis()); !r) {
        return r.error();
    }
    if (auto r = stmt.execute(); !r) {
        return r.error();
    }
    auto removed = static_cast<size_t>(db_.changes());
    if (removed > 0) {
        spdlog::debug("Purged {} expired rows from {}", removed, path_.string());
    }
    return removed;
}

bool SqliteCacheBackend::health() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_.isOpen()) {
        return false;
    }
    auto stmt = db_.prepare("SELECT 1");
    if (!stmt) {
        return false;
    }
    auto row = stmt.value().step();
    return row && row.value();
}

Result<std::vector<QueryHit>> SqliteCacheBackend::topQueries(size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_.isOpen()) {
        return unavailable();
    }
    // One label can be cached under several keys (filters, ranking settings)
    auto stmtResult = db_.prepare("SELECT label, SUM(hit_count) AS hits FROM cache_entries "
                                  "WHERE label != '' AND expires_at > ? GROUP BY label "
                                  "ORDER BY hits DESC, label ASC LIMIT ?");
    if (!stmtResult) {
        return stmtResult.error();
    }
    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bindAll(nowMillis(), static_cast<int64_t>(limit)); !r) {
        return r.error();
    }

    std::vector<QueryHit> hits;
    while (true) {
        auto row = stmt.step();
        if (!row) {
            return row.error();
        }
        if (!row.value()) {
            break;
        }
        hits.push_back(QueryHit{stmt.getString(0), static_cast<uint64_t>(stmt.getInt64(1))});
    }
    return hits;
}

Result<std::vector<WarmEntry>> SqliteCacheBackend::warm(size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_.isOpen()) {
        return unavailable();
    }
    auto stmtResult = db_.prepare("SELECT cache_key, value, expires_at FROM cache_entries "
                                  "WHERE expires_at > ? "
                                  "ORDER BY hit_count DESC, last_accessed_at DESC, cache_key ASC "
                                  "LIMIT ?");
    if (!stmtResult) {
        return stmtResult.error();
    }
    auto stmt = std::move(stmtResult).value();
    const int64_t now = nowMillis();
    if (auto r = stmt.bindAll(now, static_cast<int64_t>(limit)); !r) {
        return r.error();
    }

    std::vector<WarmEntry> entries;
    while (true) {
        auto row = stmt.step();
        if (!row) {
            return row.error();
        }
        if (!row.value()) {
            break;
        }
        auto blob = stmt.getBlob(1);
        entries.push_back(WarmEntry{stmt.getString(0),
                                    std::string(reinterpret_cast<const char*>(blob.data()),
                                                blob.size()),
                                    std::chrono::milliseconds{stmt.getInt64(2) - now}});
    }
    return entries;
}

Result<SqliteCacheStats> SqliteCacheBackend::stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_.isOpen()) {
        return unavailable();
    }
    auto stmtResult = db_.prepare(
        "SELECT COUNT(*), COALESCE(SUM(CASE WHEN expires_at <= ? THEN 1 ELSE 0 END), 0), "
        "COALESCE(SUM(hit_count), 0), COALESCE(SUM(length(value)), 0) FROM cache_entries");
    if (!stmtResult) {
        return stmtResult.error();
    }
    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, nowMillis()); !r) {
        return r.error();
    }
    auto row = stmt.step();
    if (!row) {
        return row.error();
    }
    SqliteCacheStats out;
    if (row.value()) {
        out.entries = static_cast<uint64_t>(stmt.getInt64(0));
        out.expired = static_cast<uint64_t>(stmt.getInt64(1));
        out.total_hits = static_cast<uint64_t>(stmt.getInt64(2));
        out.value_bytes = static_cast<uint64_t>(stmt.getInt64(3));
    }
    return out;
}

Result<std::optional<uint64_t>> SqliteCacheBackend::hitCount(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_.isOpen()) {
        return unavailable();
    }
    auto stmtResult = db_.prepare("SELECT hit_count FROM cache_entries WHERE cache_key = ?");
    if (!stmtResult) {
        return stmtResult.error();
    }
    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, key); !r) {
        return r.error();
    }
    auto row = stmt.step();
    if (!row) {
        return row.error();
    }
    if (!row.value()) {
        return std::optional<uint64_t>{};
    }
    return std::optional<uint64_t>{static_cast<uint64_t>(stmt.getInt64(0))};
}

} // namespace ragcore::cache
