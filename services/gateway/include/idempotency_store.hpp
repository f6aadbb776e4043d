#pragma once
#include "sqlite_db.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

enum class IdempotencyState { New, Replay, InProgress, Conflict };

const char* idempotency_state_name(IdempotencyState s);

struct IdempotencyDecision {
    IdempotencyState state{IdempotencyState::New};
    int status_code{0};               // replay only
    nlohmann::json payload;           // replay only
    std::string error;                // conflict / in_progress
};

// Idempotency keys for mutating requests, scoped by (method, path). The
// first begin() claims the key; later calls replay, conflict or report the
// request as still in progress.
class IdempotencyStore {
public:
    explicit IdempotencyStore(const std::string& db_path,
                              std::int64_t retention_seconds = 7 * 24 * 3600,
                              std::int64_t cleanup_interval_seconds = 60);

    IdempotencyDecision begin(const std::string& key, const std::string& method, const std::string& path,
                              const nlohmann::json& payload);
    void complete(const std::string& key, const std::string& method, const std::string& path,
                  int status_code, const nlohmann::json& payload);
    void clear(const std::string& key, const std::string& method, const std::string& path);

    // Deletes entries not updated within the retention window. A retention
    // of 0 keeps everything. Returns rows removed.
    int prune_expired();

    // Hex SHA-256 of the canonical (key-sorted, compact) JSON encoding.
    static std::string fingerprint(const nlohmann::json& payload);

private:
    int prune_locked(std::int64_t now);

    SqliteDb db_;
    std::int64_t retention_ms_;
    std::int64_t cleanup_interval_ms_;
    std::int64_t last_cleanup_ms_{0};
};
