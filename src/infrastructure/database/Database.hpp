#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>

namespace channelscout::infra {

/**
 * @brief RAII wrapper for SQLite prepared statements.
 *
 * Binds parameters (1-based) and reads columns (0-based) of one prepared
 * statement. Finalizes the statement on destruction.
 *
 * @note This class is non-copyable but moveable.
 */
class Statement {
public:
    /**
     * @brief Takes ownership of a prepared statement handle.
     */
    explicit Statement(sqlite3_stmt* stmt);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    void bind(int index, int value);
    void bind(int index, int64_t value);
    void bind(int index, const std::string& value);
    void bindNull(int index);

    /**
     * @brief Binds a text value, or NULL if the optional is empty.
     */
    void bind(int index, const std::optional<std::string>& value);

    /**
     * @brief Executes the statement and advances to the next row.
     * @return True if a row is available, false if done.
     * @throws std::runtime_error on SQLite errors.
     */
    bool step();

    /**
     * @brief Resets the statement and clears its bindings for re-execution.
     */
    void reset();

    int columnInt(int index) const;
    int64_t columnInt64(int index) const;
    std::string columnText(int index) const;
    bool columnIsNull(int index) const;

    /**
     * @brief Reads a text column, mapping NULL to nullopt.
     */
    std::optional<std::string> columnOptionalText(int index) const;

private:
    sqlite3_stmt* stmt_{nullptr};
};

/**
 * @brief SQLite connection holding the scan history.
 *
 * Opens the database in WAL mode and applies schema migrations on request.
 * The connection is opened in serialized mode so repositories may share it
 * across session threads.
 *
 * @note This class is non-copyable.
 */
class Database {
public:
    /**
     * @brief Opens or creates a database at the specified path.
     * @param path File path to the SQLite database, or ":memory:".
     * @throws std::runtime_error if the database cannot be opened.
     */
    explicit Database(const std::string& path);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /**
     * @brief Executes SQL without returning results.
     * @throws std::runtime_error on SQL error.
     */
    void execute(const std::string& sql);

    /**
     * @brief Prepares a SQL statement for execution.
     * @throws std::runtime_error if preparation fails.
     */
    Statement prepare(const std::string& sql);

    int64_t lastInsertRowId() const;
    int changes() const;

    void beginTransaction();
    void commit();
    void rollback();

    /**
     * @brief Executes a function within a transaction.
     *
     * Commits on success; rolls back and rethrows if the function throws.
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
     * @brief Brings the schema up to the latest version.
     */
    void runMigrations();

    /**
     * @brief Returns the applied schema version (0 for a fresh database).
     */
    int schemaVersion();

private:
    void configureConnection();
    void createMigrationsTable();
    void setVersion(int version);

    sqlite3* db_{nullptr};
    mutable std::mutex mutex_;
};

} // namespace channelscout::infra
