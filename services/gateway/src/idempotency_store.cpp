#include "idempotency_store.hpp"
#include "util.hpp"
#include <algorithm>
#include <memory>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

using json = nlohmann::json;

static const std::vector<Migration> kMigrations = {
    {"idempotency_entries_v1",
     "CREATE TABLE IF NOT EXISTS idempotency_entries (\n"
     "  key TEXT NOT NULL,\n"
     "  method TEXT NOT NULL,\n"
     "  path TEXT NOT NULL,\n"
     "  payload_hash TEXT NOT NULL,\n"
     "  status TEXT NOT NULL,\n"
     "  status_code INTEGER NOT NULL DEFAULT 0,\n"
     "  response_json TEXT NOT NULL DEFAULT '',\n"
     "  created_ms INTEGER NOT NULL,\n"
     "  updated_ms INTEGER NOT NULL,\n"
     "  PRIMARY KEY (key, method, path)\n"
     ");\n"
     "CREATE INDEX IF NOT EXISTS idx_idempotency_updated ON idempotency_entries(updated_ms);"},
};

static std::string to_hex(const unsigned char* data, unsigned int len) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0f]);
    }
    return out;
}

const char* idempotency_state_name(IdempotencyState s) {
    switch (s) {
        case IdempotencyState::New: return "new";
        case IdempotencyState::Replay: return "replay";
        case IdempotencyState::InProgress: return "in_progress";
        case IdempotencyState::Conflict: return "conflict";
    }
    return "new";
}

IdempotencyStore::IdempotencyStore(const std::string& db_path, std::int64_t retention_seconds,
                                   std::int64_t cleanup_interval_seconds)
    : db_(db_path),
      retention_ms_(std::max<std::int64_t>(0, retention_seconds) * 1000),
      cleanup_interval_ms_(std::max<std::int64_t>(0, cleanup_interval_seconds) * 1000) {
    apply_migrations(db_, kMigrations);
}

std::string IdempotencyStore::fingerprint(const json& payload) {
    // nlohmann::json objects are key-ordered, so dump() is canonical
    std::string canonical = payload.dump();
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), canonical.data(), canonical.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return to_hex(digest, len);
}

IdempotencyDecision IdempotencyStore::begin(const std::string& key, const std::string& method,
                                            const std::string& path, const json& payload) {
    std::string hash = fingerprint(payload);
    std::int64_t now = now_ms();
    std::lock_guard<std::mutex> lk(db_.mutex());

    if (retention_ms_ > 0 && now - last_cleanup_ms_ >= cleanup_interval_ms_) {
        prune_locked(now);
        last_cleanup_ms_ = now;
    }

    IdempotencyDecision decision = with_busy_retry([&] {
        IdempotencyDecision d;
        Transaction tx(db_);
        Statement sel(db_,
                      "SELECT payload_hash, status, status_code, response_json FROM idempotency_entries "
                      "WHERE key = ? AND method = ? AND path = ?;");
        sel.bind(1, key).bind(2, method).bind(3, path);
        if (!sel.step()) {
            Statement ins(db_,
                          "INSERT INTO idempotency_entries "
                          "(key, method, path, payload_hash, status, status_code, response_json, created_ms, updated_ms) "
                          "VALUES (?, ?, ?, ?, 'in_progress', 0, '', ?, ?);");
            ins.bind(1, key).bind(2, method).bind(3, path).bind(4, hash).bind(5, now).bind(6, now);
            ins.step();
            tx.commit();
            d.state = IdempotencyState::New;
            return d;
        }
        if (sel.column_text(0) != hash) {
            d.state = IdempotencyState::Conflict;
            d.error = "Idempotency key reused with different payload";
            return d;
        }
        if (sel.column_text(1) == "completed") {
            d.state = IdempotencyState::Replay;
            int code = sel.column_int(2);
            d.status_code = code > 0 ? code : 200;
            std::string raw = sel.column_text(3);
            d.payload = raw.empty() ? json::object() : json::parse(raw, nullptr, false);
            if (d.payload.is_discarded()) d.payload = json::object();
            return d;
        }
        d.state = IdempotencyState::InProgress;
        d.error = "Request with this idempotency key is already in progress";
        return d;
    });
    if (decision.state != IdempotencyState::New) {
        spdlog::debug("[idempotency] {} {} key {}: {}", method, path, key, idempotency_state_name(decision.state));
    }
    return decision;
}

void IdempotencyStore::complete(const std::string& key, const std::string& method, const std::string& path,
                                int status_code, const json& payload) {
    std::lock_guard<std::mutex> lk(db_.mutex());
    with_busy_retry([&] {
        Statement st(db_,
                     "UPDATE idempotency_entries SET status = 'completed', status_code = ?, response_json = ?, "
                     "updated_ms = ? WHERE key = ? AND method = ? AND path = ? AND status = 'in_progress';");
        st.bind(1, status_code).bind(2, payload.dump()).bind(3, now_ms());
        st.bind(4, key).bind(5, method).bind(6, path);
        st.step();
    });
}

void IdempotencyStore::clear(const std::string& key, const std::string& method, const std::string& path) {
    std::lock_guard<std::mutex> lk(db_.mutex());
    with_busy_retry([&] {
        Statement st(db_, "DELETE FROM idempotency_entries WHERE key = ? AND method = ? AND path = ?;");
        st.bind(1, key).bind(2, method).bind(3, path);
        st.step();
    });
}

int IdempotencyStore::prune_expired() {
    std::int64_t now = now_ms();
    std::lock_guard<std::mutex> lk(db_.mutex());
    last_cleanup_ms_ = now;
    return prune_locked(now);
}

int IdempotencyStore::prune_locked(std::int64_t now) {
    if (retention_ms_ <= 0) return 0;
    int removed = with_busy_retry([&] {
        Statement st(db_, "DELETE FROM idempotency_entries WHERE updated_ms < ?;");
        st.bind(1, now - retention_ms_);
        st.step();
        return db_.changes();
    });
    if (removed > 0) spdlog::info("[gateway] pruned {} expired idempotency entries", removed);
    return removed;
}
