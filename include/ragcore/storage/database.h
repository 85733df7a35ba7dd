#pragma once

#include <ragcore/core/types.h>

#include <sqlite3.h>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ragcore::storage {

/**
 * @brief How Database::open treats the target file
 */
enum class ConnectionMode {
    ReadWrite, ///< File must already exist
    ReadOnly,
    Memory,    ///< Private in-memory database, the path is ignored
    Create     ///< Read-write, creating the file when missing
};

/**
 * @brief Prepared statement owned for its whole lifetime
 *
 * Obtained from Database::prepare. Bind indices are 1-based, column indices 0-based.
 */
class Statement {
public:
    Statement() = default;
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, int value);
    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, double value);
    Result<void> bind(int index, const std::string& value);
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, std::span<const std::byte> blob);
    Result<void> bind(int index, const char* value) { return bind(index, std::string_view(value)); }

    // Binds each argument to consecutive parameters starting at 1
    template <typename... Args> Result<void> bindAll(Args&&... args) {
        int index = 0;
        Result<void> status;
        (void)((status = bind(++index, std::forward<Args>(args)), static_cast<bool>(status)) &&
               ...);
        return status;
    }

    /**
     * @brief Run a statement that produces no rows.
     */
    Result<void> execute();

    /**
     * @brief Advance to the next row.
     * @return false once the result set is exhausted
     */
    Result<bool> step();

    int64_t getInt64(int column) const;
    double getDouble(int column) const;
    std::string getString(int column) const;
    std::vector<std::byte> getBlob(int column) const;

private:
    friend class Database;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt) {}

    // One sqlite3_step, retried while the database is busy; returns the final code
    Result<int> advance(std::string_view what);

    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * @brief Single SQLite connection opened in serialized threading mode.
 *
 * Multi-statement sequences still need external serialization; transaction() does not
 * nest.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    Result<void> open(const std::string& path, ConnectionMode mode = ConnectionMode::ReadWrite);
    void close();

    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }

    Result<Statement> prepare(const std::string& sql);

    /**
     * @brief Run one or more statements that return no rows.
     */
    Result<void> execute(const std::string& sql);

    /**
     * @brief Run func inside BEGIN IMMEDIATE / COMMIT.
     *
     * An error result or an exception from func rolls the transaction back; the exception
     * is rethrown.
     */
    template <typename Func> Result<void> transaction(Func&& func) {
        if (auto begun = begin(); !begun) {
            return begun;
        }
        Result<void> outcome;
        try {
            outcome = func();
        } catch (const std::exception&) {
            abandon();
            throw;
        }
        if (!outcome) {
            abandon();
            return outcome;
        }
        return finish();
    }

    int64_t lastInsertRowId() const;

    // Rows touched by the most recent INSERT, UPDATE or DELETE
    int changes() const;

    Result<bool> tableExists(const std::string& table);
    Result<void> enableWAL();

    static std::string version();

    [[nodiscard]] const std::string& path() const { return path_; }

private:
    Result<void> begin();
    Result<void> finish();
    void abandon();

    sqlite3* db_ = nullptr;
    std::string path_;
    bool inTransaction_ = false;
};

} // namespace ragcore::storage
