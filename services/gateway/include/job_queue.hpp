#pragma once
#include "job.hpp"
#include "sqlite_db.hpp"
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// Durable job queue and per-job reply targets in one SQLite file. Safe to
// share between threads, and between processes opening the same file.
class GatewayJobQueue {
public:
    explicit GatewayJobQueue(const std::string& db_path);

    // Throws std::invalid_argument unless payload is an object with a
    // non-empty "objective" (or "input_text").
    std::string enqueue(const nlohmann::json& payload,
                        const std::string& workspace_id = "default",
                        const std::string& profile_name = "unleashed_local",
                        const nlohmann::json& reply_to = nlohmann::json::object(),
                        const std::string& job_id = "",
                        const std::string& parent_job_id = "");

    // Oldest eligible queued/retry_wait job, now running. now_ms <= 0 means
    // the current time.
    std::optional<GatewayJob> claim_next(std::int64_t now = 0);

    // Returns the new status (retry_wait or failed). Unknown id throws
    // std::invalid_argument.
    JobStatus mark_failed(const std::string& job_id, double retry_delay_seconds, int max_attempts,
                          const std::string& error = "");
    void mark_done(const std::string& job_id, const nlohmann::json& result);

    std::optional<GatewayJob> get_job(const std::string& job_id);
    // Most recently updated first; no status lists every job.
    std::vector<GatewayJob> list_jobs(std::optional<JobStatus> status = std::nullopt, int limit = 100);
    std::map<std::string, int> count_by_status();
    // Running jobs untouched for older_than_ms go back to queued. Returns
    // how many were released.
    int release_stale_jobs(std::int64_t older_than_ms);

    void upsert_delivery(const std::string& job_id, const std::string& connector,
                         const std::string& address, const std::string& token = "");
    // pending or failed targets, ordered by connector then address
    std::vector<DeliveryRecord> list_pending_deliveries(const std::string& job_id);
    std::vector<DeliveryRecord> list_deliveries(const std::string& job_id);
    void mark_delivery(const std::string& job_id, const std::string& connector, const std::string& address,
                       DeliveryStatus status, const std::string& error = "");

    // base * 2^(attempts-1), capped at one hour.
    static double backoff_seconds(double base_seconds, int attempts);

    const std::string& path() const { return db_.path(); }

private:
    static GatewayJob read_job(const Statement& st);
    static DeliveryRecord read_delivery(const Statement& st);
    std::vector<DeliveryRecord> query_deliveries(const std::string& job_id, bool pending_only);

    SqliteDb db_;
};
