#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

class SqliteError : public std::runtime_error {
public:
    SqliteError(int code, const std::string& msg) : std::runtime_error(msg), code_(code) {}
    int code() const { return code_; }
    bool busy() const;

private:
    int code_;
};

// One connection per store, opened in WAL mode with a busy timeout. The
// owner serializes use through mutex().
class SqliteDb {
public:
    explicit SqliteDb(const std::string& path, int busy_timeout_ms = 5000);
    ~SqliteDb();

    SqliteDb(const SqliteDb&) = delete;
    SqliteDb& operator=(const SqliteDb&) = delete;

    void exec(const std::string& sql);
    sqlite3* handle() const { return db_; }
    std::mutex& mutex() { return mu_; }
    const std::string& path() const { return path_; }
    int changes() const;

private:
    sqlite3* db_{nullptr};
    std::string path_;
    std::mutex mu_;
};

class Statement {
public:
    Statement(SqliteDb& db, const char* sql);
    Statement(SqliteDb& db, const std::string& sql) : Statement(db, sql.c_str()) {}
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int idx, const std::string& v);
    Statement& bind(int idx, const char* v) { return bind(idx, std::string(v)); }
    Statement& bind(int idx, std::int64_t v);
    Statement& bind(int idx, int v) { return bind(idx, static_cast<std::int64_t>(v)); }

    // true while rows are available, false when done. Throws SqliteError.
    bool step();

    std::int64_t column_int64(int col) const;
    int column_int(int col) const { return static_cast<int>(column_int64(col)); }
    std::string column_text(int col) const;

private:
    SqliteDb& db_;
    sqlite3_stmt* stmt_{nullptr};
};

// BEGIN IMMEDIATE ... COMMIT; rolls back unless commit() ran.
class Transaction {
public:
    explicit Transaction(SqliteDb& db);
    ~Transaction();
    void commit();

private:
    SqliteDb& db_;
    bool done_{false};
};

// Runs fn, retrying SQLITE_BUSY / SQLITE_LOCKED up to `attempts` times with
// a doubling sleep starting at 10 ms.
template <typename Fn>
auto with_busy_retry(Fn&& fn, int attempts = 5) -> decltype(fn()) {
    auto delay = std::chrono::milliseconds(10);
    for (int i = 1;; ++i) {
        try {
            return fn();
        } catch (const SqliteError& e) {
            if (!e.busy() || i >= attempts) throw;
        }
        std::this_thread::sleep_for(delay);
        delay *= 2;
    }
}

struct Migration {
    std::string id;
    std::string sql;
};

// Applies migrations not yet recorded in schema_migrations, in order, each
// in its own transaction. Returns the ids applied by this call.
std::vector<std::string> apply_migrations(SqliteDb& db, const std::vector<Migration>& migrations);
