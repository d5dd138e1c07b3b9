#include "infrastructure/database/Database.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace channelscout::infra {

Statement::Statement(sqlite3_stmt* stmt) : stmt_(stmt) {}

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept : stmt_(other.stmt_) {
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        stmt_ = other.stmt_;
        other.stmt_ = nullptr;
    }
    return *this;
}

namespace {

void checkBind(sqlite3_stmt* stmt, int rc, int index) {
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to bind parameter " + std::to_string(index) + ": " +
                                 sqlite3_errmsg(sqlite3_db_handle(stmt)));
    }
}

} // namespace

void Statement::bind(int index, int value) {
    checkBind(stmt_, sqlite3_bind_int(stmt_, index, value), index);
}

void Statement::bind(int index, int64_t value) {
    checkBind(stmt_, sqlite3_bind_int64(stmt_, index, value), index);
}

void Statement::bind(int index, const std::string& value) {
    checkBind(stmt_,
              sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                                SQLITE_TRANSIENT),
              index);
}

void Statement::bind(int index, const std::optional<std::string>& value) {
    if (value) {
        bind(index, *value);
    } else {
        bindNull(index);
    }
}

void Statement::bindNull(int index) {
    checkBind(stmt_, sqlite3_bind_null(stmt_, index), index);
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw std::runtime_error(std::string("SQLite step failed: ") +
                             sqlite3_errmsg(sqlite3_db_handle(stmt_)));
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

int Statement::columnInt(int index) const {
    return sqlite3_column_int(stmt_, index);
}

int64_t Statement::columnInt64(int index) const {
    return sqlite3_column_int64(stmt_, index);
}

std::string Statement::columnText(int index) const {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, index));
    return text ? text : "";
}

bool Statement::columnIsNull(int index) const {
    return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
}

std::optional<std::string> Statement::columnOptionalText(int index) const {
    if (columnIsNull(index)) {
        return std::nullopt;
    }
    return columnText(index);
}

Database::Database(const std::string& path) {
    spdlog::info("Opening scan history database: {}", path);

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database: " + error);
    }

    configureConnection();
    createMigrationsTable();
}

Database::~Database() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void Database::configureConnection() {
    execute("PRAGMA journal_mode=WAL");
    execute("PRAGMA synchronous=NORMAL");
    sqlite3_busy_timeout(db_, 5000);
}

void Database::execute(const std::string& sql) {
    std::lock_guard lock(mutex_);
    char* errMsg = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string error = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        throw std::runtime_error("SQL execution failed: " + error);
    }
}

Statement Database::prepare(const std::string& sql) {
    std::lock_guard lock(mutex_);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("Failed to prepare statement: ") +
                                 sqlite3_errmsg(db_));
    }
    return Statement(stmt);
}

int64_t Database::lastInsertRowId() const {
    return sqlite3_last_insert_rowid(db_);
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

void Database::beginTransaction() {
    execute("BEGIN TRANSACTION");
}

void Database::commit() {
    execute("COMMIT");
}

void Database::rollback() {
    execute("ROLLBACK");
}

void Database::createMigrationsTable() {
    execute(R"(
        CREATE TABLE IF NOT EXISTS schema_migrations (
            version INTEGER PRIMARY KEY,
            applied_at TEXT DEFAULT CURRENT_TIMESTAMP
        )
    )");
}

int Database::schemaVersion() {
    auto stmt = prepare("SELECT MAX(version) FROM schema_migrations");
    if (stmt.step() && !stmt.columnIsNull(0)) {
        return stmt.columnInt(0);
    }
    return 0;
}

void Database::setVersion(int version) {
    auto stmt = prepare("INSERT INTO schema_migrations (version) VALUES (?)");
    stmt.bind(1, version);
    stmt.step();
}

void Database::runMigrations() {
    int currentVersion = schemaVersion();
    spdlog::debug("Current schema version: {}", currentVersion);

    // Migration 1: validation results
    if (currentVersion < 1) {
        spdlog::info("Applying migration 1: scan results");
        execute(R"(
            CREATE TABLE IF NOT EXISTS scan_results (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                scan_id TEXT NOT NULL,
                url TEXT NOT NULL,
                protocol TEXT NOT NULL,
                is_valid INTEGER NOT NULL,
                resolution TEXT,
                codec_video TEXT,
                codec_audio TEXT,
                error_category TEXT,
                error_message TEXT,
                timestamp TEXT NOT NULL
            )
        )");

        execute("CREATE INDEX IF NOT EXISTS idx_scan_results_scan_id ON scan_results(scan_id)");
        execute(
            "CREATE INDEX IF NOT EXISTS idx_scan_results_timestamp ON scan_results(timestamp)");
        execute("CREATE INDEX IF NOT EXISTS idx_scan_results_valid ON scan_results(is_valid)");

        setVersion(1);
    }

    // Migration 2: session summaries
    if (currentVersion < 2) {
        spdlog::info("Applying migration 2: scan sessions");
        execute(R"(
            CREATE TABLE IF NOT EXISTS scan_sessions (
                scan_id TEXT PRIMARY KEY,
                mode TEXT NOT NULL,
                status TEXT NOT NULL,
                total INTEGER DEFAULT 0,
                progress INTEGER DEFAULT 0,
                valid INTEGER DEFAULT 0,
                invalid INTEGER DEFAULT 0,
                timeout_seconds INTEGER DEFAULT 10,
                started_at TEXT NOT NULL,
                completed_at TEXT,
                error TEXT
            )
        )");

        setVersion(2);
    }

    spdlog::debug("Database migrations complete. Version: {}", schemaVersion());
}

} // namespace channelscout::infra
