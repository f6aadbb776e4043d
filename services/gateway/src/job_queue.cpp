#include "job_queue.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>
#include <stdexcept>

using json = nlohmann::json;

static const std::vector<Migration> kMigrations = {
    {"gateway_jobs_v1",
     "CREATE TABLE IF NOT EXISTS jobs (\n"
     "  job_id TEXT PRIMARY KEY,\n"
     "  status TEXT NOT NULL,\n"
     "  payload_json TEXT NOT NULL,\n"
     "  workspace_id TEXT NOT NULL,\n"
     "  profile_name TEXT NOT NULL,\n"
     "  reply_to_json TEXT NOT NULL DEFAULT '{}',\n"
     "  attempts INTEGER NOT NULL DEFAULT 0,\n"
     "  next_eligible_ms INTEGER NOT NULL,\n"
     "  created_ms INTEGER NOT NULL,\n"
     "  updated_ms INTEGER NOT NULL,\n"
     "  last_error TEXT NOT NULL DEFAULT '',\n"
     "  result_json TEXT NOT NULL DEFAULT '',\n"
     "  parent_job_id TEXT NOT NULL DEFAULT ''\n"
     ");\n"
     "CREATE INDEX IF NOT EXISTS idx_jobs_claimable ON jobs(status, next_eligible_ms, created_ms);\n"
     "CREATE INDEX IF NOT EXISTS idx_jobs_status_updated ON jobs(status, updated_ms);"},
    {"gateway_deliveries_v1",
     "CREATE TABLE IF NOT EXISTS deliveries (\n"
     "  job_id TEXT NOT NULL,\n"
     "  connector TEXT NOT NULL,\n"
     "  address TEXT NOT NULL,\n"
     "  token TEXT NOT NULL DEFAULT '',\n"
     "  status TEXT NOT NULL,\n"
     "  last_error TEXT NOT NULL DEFAULT '',\n"
     "  last_attempt_ms INTEGER NOT NULL DEFAULT 0,\n"
     "  PRIMARY KEY (job_id, connector, address)\n"
     ");\n"
     "CREATE INDEX IF NOT EXISTS idx_deliveries_status ON deliveries(job_id, status);"},
};

// Column order read_job() and read_delivery() expect.
static const std::string kJobColumns =
    "job_id, status, payload_json, workspace_id, profile_name, reply_to_json, attempts, "
    "next_eligible_ms, created_ms, updated_ms, last_error, result_json, parent_job_id";

static const std::string kDeliveryColumns = "job_id, connector, address, token, status, last_error, last_attempt_ms";

static json parse_stored(const std::string& raw, json fallback) {
    if (raw.empty()) return fallback;
    json j = json::parse(raw, nullptr, false);
    return j.is_discarded() ? fallback : j;
}

static std::int64_t resolve_now(std::int64_t now) {
    return now > 0 ? now : now_ms();
}

GatewayJobQueue::GatewayJobQueue(const std::string& db_path) : db_(db_path) {
    apply_migrations(db_, kMigrations);
}

double GatewayJobQueue::backoff_seconds(double base_seconds, int attempts) {
    constexpr double kMaxBackoff = 3600.0;
    double base = std::max(0.0, base_seconds);
    if (base == 0.0) return 0.0;
    int exponent = std::max(0, attempts - 1);
    if (exponent >= 32) return kMaxBackoff;
    return std::min(kMaxBackoff, base * std::ldexp(1.0, exponent));
}

std::string GatewayJobQueue::enqueue(const json& payload, const std::string& workspace_id,
                                     const std::string& profile_name, const json& reply_to,
                                     const std::string& job_id, const std::string& parent_job_id) {
    if (!payload.is_object()) {
        throw std::invalid_argument("job payload must be a JSON object");
    }
    GatewayJob probe;
    probe.payload = payload;
    std::string objective = probe.objective();
    if (objective.empty()) {
        throw std::invalid_argument("job payload requires a non-empty 'objective'");
    }
    json stored = payload;
    stored["objective"] = objective;

    std::string id = trim(job_id).empty() ? gen_uuid() : trim(job_id);
    std::string ws = trim(workspace_id).empty() ? "default" : trim(workspace_id);
    std::string profile = trim(profile_name).empty() ? "unleashed_local" : trim(profile_name);
    std::string reply = reply_to.is_object() ? reply_to.dump() : "{}";
    std::int64_t now = now_ms();

    std::lock_guard<std::mutex> lk(db_.mutex());
    with_busy_retry([&] {
        Statement st(db_, "INSERT INTO jobs (" + kJobColumns + ") "
                          "VALUES (?, 'queued', ?, ?, ?, ?, 0, ?, ?, ?, '', '', ?);");
        st.bind(1, id).bind(2, stored.dump()).bind(3, ws).bind(4, profile).bind(5, reply);
        st.bind(6, now).bind(7, now).bind(8, now).bind(9, trim(parent_job_id));
        st.step();
    });
    spdlog::debug("[gateway] enqueued job {} workspace={} profile={}", id, ws, profile);
    return id;
}

std::optional<GatewayJob> GatewayJobQueue::claim_next(std::int64_t now) {
    std::int64_t ts = resolve_now(now);
    std::lock_guard<std::mutex> lk(db_.mutex());
    return with_busy_retry([&]() -> std::optional<GatewayJob> {
        // Single conditional UPDATE: a row another connection already moved
        // to running no longer matches the outer status filter.
        Statement st(db_,
                     "UPDATE jobs SET status = 'running', updated_ms = ?1 "
                     "WHERE job_id = ("
                     "  SELECT job_id FROM jobs"
                     "  WHERE status IN ('queued', 'retry_wait') AND next_eligible_ms <= ?2"
                     "  ORDER BY created_ms ASC, rowid ASC LIMIT 1"
                     ") AND status IN ('queued', 'retry_wait') "
                     "RETURNING " + kJobColumns + ";");
        st.bind(1, ts).bind(2, ts);
        if (!st.step()) return std::nullopt;
        GatewayJob job = read_job(st);
        st.step();
        return job;
    });
}

JobStatus GatewayJobQueue::mark_failed(const std::string& job_id, double retry_delay_seconds, int max_attempts,
                                       const std::string& error) {
    int limit = std::max(1, max_attempts);
    std::lock_guard<std::mutex> lk(db_.mutex());
    return with_busy_retry([&] {
        Transaction tx(db_);
        Statement sel(db_, "SELECT attempts FROM jobs WHERE job_id = ?;");
        sel.bind(1, job_id);
        if (!sel.step()) throw std::invalid_argument("unknown job: " + job_id);
        int attempts = sel.column_int(0) + 1;

        std::int64_t now = now_ms();
        JobStatus next = attempts < limit ? JobStatus::RetryWait : JobStatus::Failed;
        std::int64_t eligible = now;
        if (next == JobStatus::RetryWait) {
            eligible += static_cast<std::int64_t>(backoff_seconds(retry_delay_seconds, attempts) * 1000.0);
        }
        Statement upd(db_,
                      "UPDATE jobs SET status = ?, attempts = ?, next_eligible_ms = ?, "
                      "updated_ms = ?, last_error = ? WHERE job_id = ?;");
        upd.bind(1, job_status_name(next)).bind(2, attempts).bind(3, eligible);
        upd.bind(4, now).bind(5, error).bind(6, job_id);
        upd.step();
        tx.commit();
        return next;
    });
}

void GatewayJobQueue::mark_done(const std::string& job_id, const json& result) {
    std::lock_guard<std::mutex> lk(db_.mutex());
    with_busy_retry([&] {
        Statement st(db_,
                     "UPDATE jobs SET status = 'done', result_json = ?, last_error = '', updated_ms = ? "
                     "WHERE job_id = ?;");
        st.bind(1, result.dump()).bind(2, now_ms()).bind(3, job_id);
        st.step();
        if (db_.changes() == 0) throw std::invalid_argument("unknown job: " + job_id);
    });
}

std::optional<GatewayJob> GatewayJobQueue::get_job(const std::string& job_id) {
    std::lock_guard<std::mutex> lk(db_.mutex());
    return with_busy_retry([&]() -> std::optional<GatewayJob> {
        Statement st(db_, "SELECT " + kJobColumns + " FROM jobs WHERE job_id = ?;");
        st.bind(1, job_id);
        if (!st.step()) return std::nullopt;
        return read_job(st);
    });
}

std::vector<GatewayJob> GatewayJobQueue::list_jobs(std::optional<JobStatus> status, int limit) {
    int n = std::max(1, limit);
    std::lock_guard<std::mutex> lk(db_.mutex());
    return with_busy_retry([&] {
        std::vector<GatewayJob> out;
        if (status) {
            Statement st(db_, "SELECT " + kJobColumns + " FROM jobs WHERE status = ? "
                                                        "ORDER BY updated_ms DESC, rowid DESC LIMIT ?;");
            st.bind(1, job_status_name(*status)).bind(2, n);
            while (st.step()) out.push_back(read_job(st));
        } else {
            Statement st(db_, "SELECT " + kJobColumns + " FROM jobs ORDER BY updated_ms DESC, rowid DESC LIMIT ?;");
            st.bind(1, n);
            while (st.step()) out.push_back(read_job(st));
        }
        return out;
    });
}

std::map<std::string, int> GatewayJobQueue::count_by_status() {
    std::map<std::string, int> counts;
    for (JobStatus s : {JobStatus::Queued, JobStatus::Running, JobStatus::RetryWait, JobStatus::Done,
                        JobStatus::Failed}) {
        counts[job_status_name(s)] = 0;
    }
    std::lock_guard<std::mutex> lk(db_.mutex());
    with_busy_retry([&] {
        Statement st(db_, "SELECT status, COUNT(*) FROM jobs GROUP BY status;");
        while (st.step()) counts[st.column_text(0)] = st.column_int(1);
    });
    return counts;
}

int GatewayJobQueue::release_stale_jobs(std::int64_t older_than_ms) {
    std::int64_t now = now_ms();
    std::int64_t cutoff = now - std::max<std::int64_t>(0, older_than_ms);
    std::lock_guard<std::mutex> lk(db_.mutex());
    int released = with_busy_retry([&] {
        Statement st(db_,
                     "UPDATE jobs SET status = 'queued', next_eligible_ms = ?, updated_ms = ? "
                     "WHERE status = 'running' AND updated_ms < ?;");
        st.bind(1, now).bind(2, now).bind(3, cutoff);
        st.step();
        return db_.changes();
    });
    if (released > 0) spdlog::warn("[gateway] released {} stale running job(s)", released);
    return released;
}

void GatewayJobQueue::upsert_delivery(const std::string& job_id, const std::string& connector,
                                      const std::string& address, const std::string& token) {
    std::lock_guard<std::mutex> lk(db_.mutex());
    with_busy_retry([&] {
        Statement st(db_, "INSERT INTO deliveries (" + kDeliveryColumns + ") VALUES (?, ?, ?, ?, 'pending', '', 0) "
                          "ON CONFLICT(job_id, connector, address) "
                          "DO UPDATE SET token = excluded.token, status = 'pending', last_error = '';");
        st.bind(1, job_id).bind(2, connector).bind(3, address).bind(4, token);
        st.step();
    });
}

std::vector<DeliveryRecord> GatewayJobQueue::list_pending_deliveries(const std::string& job_id) {
    return query_deliveries(job_id, true);
}

std::vector<DeliveryRecord> GatewayJobQueue::list_deliveries(const std::string& job_id) {
    return query_deliveries(job_id, false);
}

std::vector<DeliveryRecord> GatewayJobQueue::query_deliveries(const std::string& job_id, bool pending_only) {
    std::lock_guard<std::mutex> lk(db_.mutex());
    return with_busy_retry([&] {
        std::vector<DeliveryRecord> out;
        std::string sql = "SELECT " + kDeliveryColumns + " FROM deliveries WHERE job_id = ? ";
        sql += pending_only ? "AND status IN ('pending', 'failed') ORDER BY connector, address;"
                            : "ORDER BY connector, address;";
        Statement st(db_, sql);
        st.bind(1, job_id);
        while (st.step()) out.push_back(read_delivery(st));
        return out;
    });
}

void GatewayJobQueue::mark_delivery(const std::string& job_id, const std::string& connector,
                                    const std::string& address, DeliveryStatus status, const std::string& error) {
    std::lock_guard<std::mutex> lk(db_.mutex());
    with_busy_retry([&] {
        Statement st(db_,
                     "UPDATE deliveries SET status = ?, last_error = ?, last_attempt_ms = ? "
                     "WHERE job_id = ? AND connector = ? AND address = ?;");
        st.bind(1, delivery_status_name(status)).bind(2, error).bind(3, now_ms());
        st.bind(4, job_id).bind(5, connector).bind(6, address);
        st.step();
    });
}

GatewayJob GatewayJobQueue::read_job(const Statement& st) {
    GatewayJob job;
    job.job_id = st.column_text(0);
    job.status = parse_job_status(st.column_text(1)).value_or(JobStatus::Queued);
    job.payload = parse_stored(st.column_text(2), json::object());
    job.workspace_id = st.column_text(3);
    job.profile_name = st.column_text(4);
    job.reply_to = parse_stored(st.column_text(5), json::object());
    job.attempts = st.column_int(6);
    job.next_eligible_ms = st.column_int64(7);
    job.created_ms = st.column_int64(8);
    job.updated_ms = st.column_int64(9);
    job.last_error = st.column_text(10);
    job.result = parse_stored(st.column_text(11), json());
    job.parent_job_id = st.column_text(12);
    return job;
}

DeliveryRecord GatewayJobQueue::read_delivery(const Statement& st) {
    DeliveryRecord d;
    d.job_id = st.column_text(0);
    d.connector = st.column_text(1);
    d.address = st.column_text(2);
    d.token = st.column_text(3);
    d.status = parse_delivery_status(st.column_text(4)).value_or(DeliveryStatus::Pending);
    d.last_error = st.column_text(5);
    d.last_attempt_ms = st.column_int64(6);
    return d;
}
