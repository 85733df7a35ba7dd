#include <ragcore/storage/database.h>

#include <spdlog/spdlog.h>

#include <thread>
#include <utility>

namespace ragcore::storage {

namespace {

constexpr int kBusyAttempts = 5;
constexpr std::chrono::milliseconds kFirstBusyWait{10};
constexpr int kBusyTimeoutMs = 5000;
constexpr size_t kSqlPreview = 100;

Result<void> bindStatus(int rc, int index, std::string_view kind) {
    if (rc == SQLITE_OK) {
        return {};
    }
    return Error{ErrorCode::DatabaseError,
                 fmt::format("cannot bind {} to parameter {}: {}", kind, index, sqlite3_errstr(rc))};
}

int openFlags(ConnectionMode mode) {
    int flags = SQLITE_OPEN_FULLMUTEX;
    switch (mode) {
        case ConnectionMode::ReadOnly:
            return flags | SQLITE_OPEN_READONLY;
        case ConnectionMode::ReadWrite:
            return flags | SQLITE_OPEN_READWRITE;
        case ConnectionMode::Create:
            return flags | SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
        case ConnectionMode::Memory:
            return flags | SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_MEMORY;
    }
    return flags | SQLITE_OPEN_READWRITE;
}

Error notOpen() {
    return Error{ErrorCode::InvalidState, "database is not open"};
}

} // namespace

Statement::~Statement() {
    sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& other) noexcept : stmt_(std::exchange(other.stmt_, nullptr)) {}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        sqlite3_finalize(stmt_);
        stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
}

Result<void> Statement::bind(int index, std::nullptr_t) {
    return bindStatus(sqlite3_bind_null(stmt_, index), index, "null");
}

Result<void> Statement::bind(int index, int value) {
    return bindStatus(sqlite3_bind_int(stmt_, index, value), index, "int");
}

Result<void> Statement::bind(int index, int64_t value) {
    return bindStatus(sqlite3_bind_int64(stmt_, index, value), index, "int64");
}

Result<void> Statement::bind(int index, double value) {
    return bindStatus(sqlite3_bind_double(stmt_, index, value), index, "double");
}

Result<void> Statement::bind(int index, const std::string& value) {
    return bind(index, std::string_view(value));
}

Result<void> Statement::bind(int index, std::string_view value) {
    const int rc = sqlite3_bind_text64(stmt_, index, value.data(), value.size(), SQLITE_TRANSIENT,
                                       SQLITE_UTF8);
    return bindStatus(rc, index, "text");
}

Result<void> Statement::bind(int index, std::span<const std::byte> blob) {
    // A null pointer would bind NULL rather than an empty blob
    static const std::byte kEmpty{};
    const void* data = blob.empty() ? &kEmpty : static_cast<const void*>(blob.data());
    const int rc = sqlite3_bind_blob64(stmt_, index, data, blob.size(), SQLITE_TRANSIENT);
    return bindStatus(rc, index, "blob");
}

Result<int> Statement::advance(std::string_view what) {
    if (!stmt_) {
        return Error{ErrorCode::InvalidState, "statement was not prepared"};
    }
    auto wait = kFirstBusyWait;
    int rc = SQLITE_OK;
    for (int attempt = 1; attempt <= kBusyAttempts; ++attempt) {
        rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW || rc == SQLITE_DONE) {
            return rc;
        }
        if (rc != SQLITE_BUSY && rc != SQLITE_LOCKED) {
            break;
        }
        if (attempt < kBusyAttempts) {
            sqlite3_reset(stmt_);
            std::this_thread::sleep_for(wait);
            wait *= 2;
        }
    }

    std::string message = fmt::format("{} failed: {}", what, sqlite3_errstr(rc));
    if (rc == SQLITE_CONSTRAINT) {
        if (const char* sql = sqlite3_sql(stmt_)) {
            std::string_view text(sql);
            message += fmt::format(" [SQL: {}{}]", text.substr(0, kSqlPreview),
                                   text.size() > kSqlPreview ? "..." : "");
        }
    }
    // Leave the statement reusable after a failed step
    sqlite3_reset(stmt_);
    return Error{ErrorCode::DatabaseError, std::move(message)};
}

Result<void> Statement::execute() {
    auto rc = advance("execute");
    if (!rc) {
        return rc.error();
    }
    return {};
}

Result<bool> Statement::step() {
    auto rc = advance("step");
    if (!rc) {
        return rc.error();
    }
    return rc.value() == SQLITE_ROW;
}

int64_t Statement::getInt64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

double Statement::getDouble(int column) const {
    return sqlite3_column_double(stmt_, column);
}

std::string Statement::getString(int column) const {
    const auto* text = sqlite3_column_text(stmt_, column);
    const int bytes = sqlite3_column_bytes(stmt_, column);
    if (!text || bytes <= 0) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(bytes));
}

std::vector<std::byte> Statement::getBlob(int column) const {
    const auto* data = static_cast<const std::byte*>(sqlite3_column_blob(stmt_, column));
    const int bytes = sqlite3_column_bytes(stmt_, column);
    if (!data || bytes <= 0) {
        return {};
    }
    return std::vector<std::byte>(data, data + bytes);
}

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)), path_(std::move(other.path_)),
      inTransaction_(std::exchange(other.inTransaction_, false)) {}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = std::exchange(other.db_, nullptr);
        path_ = std::move(other.path_);
        inTransaction_ = std::exchange(other.inTransaction_, false);
    }
    return *this;
}

Result<void> Database::open(const std::string& path, ConnectionMode mode) {
    if (db_) {
        return Error{ErrorCode::InvalidState, "database already open: " + path_};
    }

    sqlite3* handle = nullptr;
    const int rc = sqlite3_open_v2(path.c_str(), &handle, openFlags(mode), nullptr);
    if (rc != SQLITE_OK) {
        std::string reason = handle ? sqlite3_errmsg(handle) : sqlite3_errstr(rc);
        sqlite3_close(handle);
        return Error{ErrorCode::DatabaseError,
                     fmt::format("cannot open database '{}': {}", path, reason)};
    }

    sqlite3_busy_timeout(handle, kBusyTimeoutMs);
    db_ = handle;
    path_ = path;
    spdlog::debug("Opened SQLite {} database at {}", sqlite3_libversion(), path_);
    return {};
}

void Database::close() {
    if (db_) {
        // Statements still alive keep the connection until they are finalized
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
    path_.clear();
    inTransaction_ = false;
}

Result<Statement> Database::prepare(const std::string& sql) {
    if (!db_) {
        return notOpen();
    }
    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &stmt,
                                      nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt);
        return Error{ErrorCode::DatabaseError,
                     fmt::format("cannot prepare statement: {}", sqlite3_errmsg(db_))};
    }
    return Statement(stmt);
}

Result<void> Database::execute(const std::string& sql) {
    if (!db_) {
        return notOpen();
    }
    char* raw = nullptr;
    const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &raw);
    if (rc == SQLITE_OK) {
        return {};
    }
    std::string reason = raw ? raw : sqlite3_errstr(rc);
    sqlite3_free(raw);
    spdlog::error("SQL exec failed ({}): {}", reason, sql);
    return Error{ErrorCode::DatabaseError, "SQL exec failed: " + reason};
}

Result<void> Database::begin() {
    if (inTransaction_) {
        return Error{ErrorCode::InvalidState, "transaction already active on " + path_};
    }
    auto r = execute("BEGIN IMMEDIATE");
    inTransaction_ = static_cast<bool>(r);
    return r;
}

Result<void> Database::finish() {
    auto r = execute("COMMIT");
    if (!r) {
        abandon();
        return r;
    }
    inTransaction_ = false;
    return {};
}

void Database::abandon() {
    if (!inTransaction_) {
        return;
    }
    inTransaction_ = false;
    if (auto r = execute("ROLLBACK"); !r) {
        spdlog::warn("Rollback failed on {}: {}", path_, r.error().message);
    }
}

int64_t Database::lastInsertRowId() const {
    return db_ ? sqlite3_last_insert_rowid(db_) : 0;
}

int Database::changes() const {
    return db_ ? sqlite3_changes(db_) : 0;
}

Result<bool> Database::tableExists(const std::string& table) {
    auto stmt = prepare("SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?");
    if (!stmt) {
        return stmt.error();
    }
    if (auto r = stmt.value().bind(1, table); !r) {
        return r.error();
    }
    return stmt.value().step();
}

Result<void> Database::enableWAL() {
    auto stmt = prepare("PRAGMA journal_mode=WAL");
    if (!stmt) {
        return stmt.error();
    }
    auto row = stmt.value().step();
    if (!row) {
        return row.error();
    }
    // In-memory databases report "memory" and stay that way
    auto mode = row.value() ? stmt.value().getString(0) : std::string{};
    if (mode != "wal" && mode != "memory") {
        spdlog::warn("journal_mode=WAL not applied to {} (mode '{}')", path_, mode);
    }
    return {};
}

std::string Database::version() {
    return sqlite3_libversion();
}

} // namespace ragcore::storage
