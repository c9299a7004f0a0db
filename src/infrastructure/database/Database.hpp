/**
 * @file Database.hpp
 * @brief SQLite connection, prepared statements and schema migrations.
 */

#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <stdexcept>
#include <string>

namespace lanwatch::infra {

/**
 * @brief Raised when SQLite rejects an open, prepare, bind or step.
 */
class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Owning handle for one prepared statement.
 *
 * Parameters are 1-based, columns 0-based, as in the SQLite C API.
 * Move-only; the statement is finalized on destruction.
 */
class Statement {
public:
    explicit Statement(sqlite3_stmt* stmt);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    void bind(int index, int value);
    void bind(int index, int64_t value);
    void bind(int index, double value);
    void bind(int index, const std::string& value);

    /// Binds NULL when @p value is empty.
    void bind(int index, const std::optional<std::string>& value);
    void bindNull(int index);

    /**
     * @brief Advances to the next row.
     * @return True while a row is available.
     * @throws StorageError on any result other than SQLITE_ROW or SQLITE_DONE.
     */
    bool step();

    /// Rewinds the statement and clears its bindings for another run.
    void reset();

    int columnInt(int index) const;
    int64_t columnInt64(int index) const;
    double columnDouble(int index) const;

    /// Text value; NULL reads as an empty string.
    std::string columnText(int index) const;
    std::optional<std::string> columnOptionalText(int index) const;
    bool columnIsNull(int index) const;

private:
    sqlite3_stmt* stmt_{nullptr};
};

/**
 * @brief The device inventory database.
 *
 * Opens the file in WAL mode with foreign keys enabled. The schema is
 * versioned through the schema_migrations table; runMigrations() applies
 * every step newer than the stored version, each inside its own transaction.
 *
 * @note Non-copyable. One instance is shared by all repositories.
 */
class Database {
public:
    /**
     * @brief Opens or creates the database file.
     * @throws StorageError if SQLite cannot open it.
     */
    explicit Database(const std::string& path);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /// Runs one or more statements that produce no rows.
    void execute(const std::string& sql);

    /// @throws StorageError if the SQL does not compile.
    Statement prepare(const std::string& sql);

    int64_t lastInsertRowId() const;

    /// Rows touched by the most recent INSERT, UPDATE or DELETE.
    int changes() const;

    void beginTransaction();
    void commit();
    void rollback();

    /**
     * @brief Runs @p func between BEGIN and COMMIT.
     *
     * Any exception rolls the transaction back and is rethrown.
     */
    template <typename Func>
    void transaction(Func&& func) {
        beginTransaction();
        try {
            func();
            commit();
        } catch (...) {
            rollback();
            throw;
        }
    }

    /**
     * @brief Brings the schema up to date.
     *
     * Version 1 creates devices, scan_records and scan_sessions.
     * Version 2 adds oui_vendors and seeds it with common prefixes.
     * Safe to call on every start.
     */
    void runMigrations();

    /// Highest applied migration, 0 for a fresh file.
    int schemaVersion();

private:
    void configureConnection();
    void createMigrationsTable();
    void recordVersion(int version);

    sqlite3* db_{nullptr};
    mutable std::mutex mutex_;
};

} // namespace lanwatch::infra
