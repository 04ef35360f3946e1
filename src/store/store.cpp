// ==============================================================================
// store.cpp - Встроенное хранилище (SQLite)
// ==============================================================================

#include "dds/store.hpp"

#include "dds/platform.hpp"

#include <sqlite3.h>
#include <system_error>
#include <utility>

namespace dds::store {

namespace {

// ----------------------------------------------------------------------------
// Схема v1
// ----------------------------------------------------------------------------

constexpr const char* kConnectionPragmas = R"SQL(
    PRAGMA journal_mode = WAL;
    PRAGMA synchronous = NORMAL;
    PRAGMA temp_store = MEMORY;
    PRAGMA cache_size = -16000;
)SQL";

constexpr const char* kSchemaV1 = R"SQL(
    CREATE TABLE IF NOT EXISTS directory_cache (
        path           TEXT PRIMARY KEY,
        last_searched  INTEGER NOT NULL,
        completed      INTEGER NOT NULL DEFAULT 0,
        session_id     TEXT,
        target_found   INTEGER NOT NULL DEFAULT 0,
        target_deleted INTEGER NOT NULL DEFAULT 0,
        error          TEXT
    );
    CREATE INDEX IF NOT EXISTS idx_cache_last_searched ON directory_cache(last_searched);
    CREATE INDEX IF NOT EXISTS idx_cache_incomplete
        ON directory_cache(completed) WHERE completed = 0;
    CREATE INDEX IF NOT EXISTS idx_cache_fresh
        ON directory_cache(last_searched, completed) WHERE completed = 1;

    CREATE TABLE IF NOT EXISTS search_sessions (
        id            TEXT PRIMARY KEY,
        root          TEXT NOT NULL,
        is_recursive  INTEGER NOT NULL,
        is_dry_run    INTEGER NOT NULL,
        force_refresh INTEGER NOT NULL,
        status        TEXT NOT NULL DEFAULT 'active',
        created_at    INTEGER NOT NULL,
        updated_at    INTEGER NOT NULL,
        dirs_new      INTEGER NOT NULL DEFAULT 0,
        dirs_resumed  INTEGER NOT NULL DEFAULT 0,
        dirs_skipped  INTEGER NOT NULL DEFAULT 0,
        dirs_errored  INTEGER NOT NULL DEFAULT 0,
        files_found   INTEGER NOT NULL DEFAULT 0,
        files_deleted INTEGER NOT NULL DEFAULT 0
    );
    CREATE INDEX IF NOT EXISTS idx_sessions_status ON search_sessions(status, updated_at);
    CREATE INDEX IF NOT EXISTS idx_sessions_root ON search_sessions(root, status);

    CREATE TABLE IF NOT EXISTS work_queue (
        session_id  TEXT NOT NULL,
        path        TEXT NOT NULL,
        state       TEXT NOT NULL DEFAULT 'pending',
        enqueued_at INTEGER NOT NULL,
        error       TEXT,
        PRIMARY KEY (session_id, path)
    );
    CREATE INDEX IF NOT EXISTS idx_queue_session_state
        ON work_queue(session_id, state, enqueued_at);

    CREATE TABLE IF NOT EXISTS found_files (
        session_id TEXT NOT NULL,
        path       TEXT NOT NULL,
        found_at   INTEGER NOT NULL,
        outcome    TEXT,
        note       TEXT,
        PRIMARY KEY (session_id, path)
    );
    CREATE INDEX IF NOT EXISTS idx_found_session_outcome ON found_files(session_id, outcome);
)SQL";

bool table_exists(Database& db, const char* table) {
    Statement stmt = db.prepare("SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?1");
    stmt.bind(1, std::string_view(table));
    return stmt.step();
}

bool table_has_column(Database& db, const char* table, const char* column) {
    std::string sql = "PRAGMA table_info(";
    sql += table;
    sql += ")";

    Statement stmt = db.prepare(sql);
    while (stmt.step()) {
        if (stmt.column_text(1) == column) {
            return true;
        }
    }
    return false;
}

/// v0 -> v1. Предыдущие версии утилиты хранили кэш в searched_dirs, а затем
/// в directory_cache с колонками *_at / ds_store_*; строки кэша переносятся,
/// очередь и сессии старого формата отбрасываются.
void migrate_v0_to_v1(Database& db) {
    const bool legacy_cache =
        table_exists(db, "directory_cache") &&
        table_has_column(db, "directory_cache", "last_searched_at");
    if (legacy_cache) {
        db.exec("ALTER TABLE directory_cache RENAME TO directory_cache_legacy");
    }
    if (table_exists(db, "work_queue") && table_has_column(db, "work_queue", "discovered_at")) {
        db.exec("DROP TABLE work_queue");
    }
    if (table_exists(db, "found_files") && table_has_column(db, "found_files", "file_path")) {
        db.exec("DROP TABLE found_files");
    }
    if (table_exists(db, "search_sessions") &&
        table_has_column(db, "search_sessions", "session_id")) {
        db.exec("DROP TABLE search_sessions");
    }

    // Индексы старой схемы имели те же имена, но другие колонки
    db.exec("DROP INDEX IF EXISTS idx_last_searched");
    db.exec("DROP INDEX IF EXISTS idx_incomplete");
    db.exec("DROP INDEX IF EXISTS idx_fresh_complete");

    db.exec(kSchemaV1);

    if (legacy_cache) {
        db.exec(R"SQL(
            INSERT OR REPLACE INTO directory_cache
                (path, last_searched, completed, target_found, target_deleted, error)
            SELECT path, last_searched_at, search_completed,
                   ds_store_found, ds_store_deleted, error_message
            FROM directory_cache_legacy
        )SQL");
        db.exec("DROP TABLE directory_cache_legacy");
    }

    if (table_exists(db, "searched_dirs")) {
        db.exec(R"SQL(
            INSERT OR IGNORE INTO directory_cache (path, last_searched, completed)
            SELECT path, last_searched_at, 1 FROM searched_dirs
        )SQL");
        db.exec("DROP TABLE searched_dirs");
    }
}

}  // namespace

// ----------------------------------------------------------------------------
// StoreError
// ----------------------------------------------------------------------------

StoreError::StoreError(const std::string& message, int code, std::string sql)
    : std::runtime_error(message), code_(code), sql_(std::move(sql)) {}

// ----------------------------------------------------------------------------
// Statement
// ----------------------------------------------------------------------------

Statement::Statement(Database& db, std::string_view sql) : db_(&db), sql_(sql) {
    int rc = sqlite3_prepare_v2(db.handle(), sql_.c_str(), static_cast<int>(sql_.size()), &stmt_,
                                nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = "failed to prepare statement - " + db.last_error();
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
        throw StoreError(msg, rc, sql_);
    }
}

Statement::~Statement() {
    if (stmt_ != nullptr) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept
    : db_(other.db_), stmt_(std::exchange(other.stmt_, nullptr)), sql_(std::move(other.sql_)) {}

Statement& Statement::bind(int index, std::int64_t value) {
    int rc = sqlite3_bind_int64(stmt_, index, value);
    if (rc != SQLITE_OK) {
        throw StoreError("failed to bind parameter - " + db_->last_error(), rc, sql_);
    }
    return *this;
}

Statement& Statement::bind(int index, bool value) {
    return bind(index, static_cast<std::int64_t>(value ? 1 : 0));
}

Statement& Statement::bind(int index, std::string_view value) {
    int rc = sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        throw StoreError("failed to bind parameter - " + db_->last_error(), rc, sql_);
    }
    return *this;
}

Statement& Statement::bind(int index, const std::optional<std::string>& value) {
    if (!value.has_value()) {
        return bind_null(index);
    }
    return bind(index, std::string_view(*value));
}

Statement& Statement::bind_null(int index) {
    int rc = sqlite3_bind_null(stmt_, index);
    if (rc != SQLITE_OK) {
        throw StoreError("failed to bind parameter - " + db_->last_error(), rc, sql_);
    }
    return *this;
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw StoreError("failed to execute statement - " + db_->last_error(), rc, sql_);
}

int Statement::execute() {
    while (step()) {
    }
    return db_->changes();
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

std::int64_t Statement::column_int64(int col) const {
    return sqlite3_column_int64(stmt_, col);
}

std::string Statement::column_text(int col) const {
    const unsigned char* text = sqlite3_column_text(stmt_, col);
    if (text == nullptr) {
        return {};
    }
    int len = sqlite3_column_bytes(stmt_, col);
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(len));
}

std::optional<std::string> Statement::column_optional_text(int col) const {
    if (column_is_null(col)) {
        return std::nullopt;
    }
    return column_text(col);
}

bool Statement::column_is_null(int col) const {
    return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

// ----------------------------------------------------------------------------
// Database
// ----------------------------------------------------------------------------

Database::Database(sqlite3* db, std::filesystem::path path) : db_(db), path_(std::move(path)) {}

Database::~Database() {
    if (db_ != nullptr) {
        sqlite3_close_v2(db_);
    }
}

std::unique_ptr<Database> Database::open(const std::filesystem::path& path) {
    // Родительский каталог (~/.dds) может ещё не существовать
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw StoreError("failed to create database directory '" +
                                 platform::path_to_utf8(path.parent_path()) + "' - " + ec.message(),
                             SQLITE_CANTOPEN);
        }
    }

    sqlite3* raw = nullptr;
    const std::string path_utf8 = platform::path_to_utf8(path);
    int rc = sqlite3_open_v2(path_utf8.c_str(), &raw,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = "failed to open database '" + path_utf8 + "' - " +
                          (raw != nullptr ? sqlite3_errmsg(raw) : sqlite3_errstr(rc));
        sqlite3_close_v2(raw);
        throw StoreError(msg, rc);
    }

    std::unique_ptr<Database> db(new Database(raw, path));

    // busy_timeout до любых запросов: второй процесс ждёт, а не падает с BUSY
    sqlite3_busy_timeout(raw, 10000);
    db->exec(kConnectionPragmas);
    db->migrate();
    return db;
}

void Database::exec(std::string_view sql) {
    std::string text(sql);
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, text.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string msg = "SQL error - ";
        msg += (err_msg != nullptr) ? err_msg : sqlite3_errstr(rc);
        sqlite3_free(err_msg);
        throw StoreError(msg, rc, text);
    }
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

bool Database::autocommit() const {
    return sqlite3_get_autocommit(db_) != 0;
}

int Database::schema_version() {
    auto guard = lock();
    Statement stmt = prepare("PRAGMA user_version");
    if (!stmt.step()) {
        return 0;
    }
    return static_cast<int>(stmt.column_int64(0));
}

std::string Database::integrity_check() {
    auto guard = lock();
    Statement stmt = prepare("PRAGMA integrity_check");
    if (!stmt.step()) {
        return "integrity_check returned no rows";
    }
    return stmt.column_text(0);
}

std::string Database::last_error() const {
    return sqlite3_errmsg(db_);
}

void Database::migrate() {
    auto guard = lock();
    const int version = schema_version();
    if (version == SCHEMA_VERSION) {
        return;
    }
    if (version > SCHEMA_VERSION) {
        throw StoreError("database schema version " + std::to_string(version) +
                             " is newer than supported version " +
                             std::to_string(SCHEMA_VERSION),
                         SQLITE_MISMATCH);
    }

    Transaction tx(*this);
    if (version < 1) {
        migrate_v0_to_v1(*this);
    }
    exec("PRAGMA user_version = " + std::to_string(SCHEMA_VERSION));
    tx.commit();
}

// ----------------------------------------------------------------------------
// Transaction
// ----------------------------------------------------------------------------

Transaction::Transaction(Database& db) : db_(db), lock_(db.lock()) {
    if (db_.autocommit()) {
        db_.exec("BEGIN IMMEDIATE");
    } else {
        savepoint_ = "sp_" + std::to_string(++db_.savepoint_depth_);
        try {
            db_.exec("SAVEPOINT " + savepoint_);
        } catch (...) {
            --db_.savepoint_depth_;
            throw;
        }
    }
}

Transaction::~Transaction() {
    if (!done_) {
        rollback();
    }
}

void Transaction::commit() {
    if (done_) {
        return;
    }
    try {
        if (savepoint_.empty()) {
            db_.exec("COMMIT");
        } else {
            db_.exec("RELEASE " + savepoint_);
            --db_.savepoint_depth_;
        }
        done_ = true;
    } catch (const StoreError&) {
        rollback();
        throw;
    }
}

void Transaction::rollback() noexcept {
    if (done_) {
        return;
    }
    done_ = true;
    // Ошибки отката не пробрасываются из деструктора: соединение
    // после неудачного ROLLBACK SQLite откатывает само
    if (savepoint_.empty()) {
        if (!db_.autocommit()) {
            sqlite3_exec(db_.handle(), "ROLLBACK", nullptr, nullptr, nullptr);
        }
    } else {
        const std::string sql = "ROLLBACK TO " + savepoint_ + "; RELEASE " + savepoint_;
        sqlite3_exec(db_.handle(), sql.c_str(), nullptr, nullptr, nullptr);
        --db_.savepoint_depth_;
    }
}

}  // namespace dds::store
