#include "sqlite_db.hpp"
#include "util.hpp"
#include <filesystem>
#include <spdlog/spdlog.h>
#include <sqlite3.h>

bool SqliteError::busy() const {
    int primary = code_ & 0xff;
    return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}

SqliteDb::SqliteDb(const std::string& path, int busy_timeout_ms) : path_(path) {
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty() && path != ":memory:") {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) throw std::runtime_error("Failed to create directory " + parent.string() + ": " + ec.message());
    }
    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open SQLite DB: " + path + ": " + msg);
    }
    sqlite3_busy_timeout(db_, busy_timeout_ms);
    with_busy_retry([&] { exec("PRAGMA journal_mode=WAL;"); });
    exec("PRAGMA synchronous=NORMAL;");
}

SqliteDb::~SqliteDb() {
    if (db_) sqlite3_close(db_);
}

void SqliteDb::exec(const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        throw SqliteError(rc, "SQLite error: " + msg);
    }
}

int SqliteDb::changes() const {
    return sqlite3_changes(db_);
}

Statement::Statement(SqliteDb& db, const char* sql) : db_(db) {
    int rc = sqlite3_prepare_v2(db.handle(), sql, -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        throw SqliteError(rc, std::string("SQLite prepare failed: ") + sqlite3_errmsg(db.handle()));
    }
}

Statement::~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

Statement& Statement::bind(int idx, const std::string& v) {
    sqlite3_bind_text(stmt_, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
    return *this;
}

Statement& Statement::bind(int idx, std::int64_t v) {
    sqlite3_bind_int64(stmt_, idx, v);
    return *this;
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    std::string msg = sqlite3_errmsg(db_.handle());
    sqlite3_reset(stmt_);
    throw SqliteError(rc, "SQLite step failed: " + msg);
}

std::int64_t Statement::column_int64(int col) const {
    return sqlite3_column_int64(stmt_, col);
}

std::string Statement::column_text(int col) const {
    const unsigned char* t = sqlite3_column_text(stmt_, col);
    return t ? std::string(reinterpret_cast<const char*>(t), sqlite3_column_bytes(stmt_, col)) : std::string();
}

Transaction::Transaction(SqliteDb& db) : db_(db) {
    db_.exec("BEGIN IMMEDIATE;");
}

Transaction::~Transaction() {
    if (done_) return;
    char* err = nullptr;
    if (sqlite3_exec(db_.handle(), "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
        spdlog::warn("SQLite rollback failed: {}", err ? err : "unknown");
    }
    sqlite3_free(err);
}

void Transaction::commit() {
    db_.exec("COMMIT;");
    done_ = true;
}

std::vector<std::string> apply_migrations(SqliteDb& db, const std::vector<Migration>& migrations) {
    std::lock_guard<std::mutex> lk(db.mutex());
    with_busy_retry([&] {
        db.exec("CREATE TABLE IF NOT EXISTS schema_migrations (\n"
                "  migration_id TEXT PRIMARY KEY,\n"
                "  applied_at TEXT NOT NULL\n"
                ");");
    });

    std::vector<std::string> applied;
    for (const auto& m : migrations) {
        bool ran = with_busy_retry([&] {
            Transaction tx(db);
            Statement check(db, "SELECT 1 FROM schema_migrations WHERE migration_id = ?;");
            check.bind(1, m.id);
            if (check.step()) return false;
            db.exec(m.sql);
            Statement rec(db, "INSERT INTO schema_migrations (migration_id, applied_at) VALUES (?, ?);");
            rec.bind(1, m.id).bind(2, iso8601_utc(now_ms()));
            rec.step();
            tx.commit();
            return true;
        });
        if (ran) {
            spdlog::info("[gateway] applied migration {} to {}", m.id, db.path());
            applied.push_back(m.id);
        }
    }
    return applied;
}
