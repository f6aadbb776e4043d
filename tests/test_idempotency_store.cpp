#include "idempotency_store.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using json = nlohmann::json;

namespace {
void age_entry(const std::string& path, const std::string& key) {
    SqliteDb db(path);
    Statement st(db, "UPDATE idempotency_entries SET created_ms = 0, updated_ms = 0 WHERE key = ?;");
    st.bind(1, key);
    st.step();
}
}  // namespace

TEST(IdempotencyStore, BeginCompleteThenReplay) {
    TempDir dir;
    IdempotencyStore store(dir.file("idem.db"));
    auto d = store.begin("key-1", "POST", "/run", {{"objective", "demo"}});
    EXPECT_EQ(d.state, IdempotencyState::New);

    store.complete("key-1", "POST", "/run", 200, {{"status", "ok"}});

    d = store.begin("key-1", "POST", "/run", {{"objective", "demo"}});
    EXPECT_EQ(d.state, IdempotencyState::Replay);
    EXPECT_EQ(d.status_code, 200);
    EXPECT_EQ(d.payload["status"], "ok");
}

TEST(IdempotencyStore, InProgressAndConflict) {
    TempDir dir;
    IdempotencyStore store(dir.file("idem.db"));
    EXPECT_EQ(store.begin("key-1", "POST", "/run", {{"objective", "demo"}}).state, IdempotencyState::New);

    auto again = store.begin("key-1", "POST", "/run", {{"objective", "demo"}});
    EXPECT_EQ(again.state, IdempotencyState::InProgress);
    EXPECT_NE(again.error.find("in progress"), std::string::npos);

    auto other = store.begin("key-1", "POST", "/run", {{"objective", "different"}});
    EXPECT_EQ(other.state, IdempotencyState::Conflict);
    EXPECT_NE(other.error.find("different payload"), std::string::npos);
}

TEST(IdempotencyStore, KeysAreScopedByMethodAndPath) {
    TempDir dir;
    IdempotencyStore store(dir.file("idem.db"));
    EXPECT_EQ(store.begin("k", "POST", "/run", {{"a", 1}}).state, IdempotencyState::New);
    EXPECT_EQ(store.begin("k", "POST", "/run_async", {{"a", 1}}).state, IdempotencyState::New);
    EXPECT_EQ(store.begin("k", "PUT", "/run", {{"a", 1}}).state, IdempotencyState::New);
}

TEST(IdempotencyStore, FingerprintIgnoresKeyOrder) {
    json a = json::parse(R"({"a":1,"b":[1,2]})");
    json b = json::parse(R"({"b":[1,2],"a":1})");
    EXPECT_EQ(IdempotencyStore::fingerprint(a), IdempotencyStore::fingerprint(b));
    EXPECT_NE(IdempotencyStore::fingerprint(a), IdempotencyStore::fingerprint(json::parse(R"({"a":2})")));
    EXPECT_EQ(IdempotencyStore::fingerprint(a).size(), 64u);
}

TEST(IdempotencyStore, ClearAllowsRetry) {
    TempDir dir;
    IdempotencyStore store(dir.file("idem.db"));
    EXPECT_EQ(store.begin("k", "POST", "/run", {{"a", 1}}).state, IdempotencyState::New);
    store.clear("k", "POST", "/run");
    EXPECT_EQ(store.begin("k", "POST", "/run", {{"a", 2}}).state, IdempotencyState::New);
}

TEST(IdempotencyStore, CleanupOnBeginExpiresOldEntries) {
    TempDir dir;
    const std::string path = dir.file("idem.db");
    IdempotencyStore store(path, 1, 0);
    EXPECT_EQ(store.begin("key-1", "POST", "/run", {{"objective", "demo"}}).state, IdempotencyState::New);
    store.complete("key-1", "POST", "/run", 200, {{"status", "ok"}});
    age_entry(path, "key-1");

    EXPECT_EQ(store.begin("key-2", "POST", "/run_async", {{"objective", "demo2"}}).state, IdempotencyState::New);
    EXPECT_EQ(store.begin("key-1", "POST", "/run", {{"objective", "demo"}}).state, IdempotencyState::New);
}

TEST(IdempotencyStore, PruneExpiredReturnsRemovedCount) {
    TempDir dir;
    const std::string path = dir.file("idem.db");
    IdempotencyStore store(path, 1, 3600);
    EXPECT_EQ(store.begin("old-key", "POST", "/run", {{"objective", "demo"}}).state, IdempotencyState::New);
    age_entry(path, "old-key");
    EXPECT_EQ(store.prune_expired(), 1);
    EXPECT_EQ(store.prune_expired(), 0);
}

TEST(IdempotencyStore, StateNames) {
    EXPECT_STREQ(idempotency_state_name(IdempotencyState::New), "new");
    EXPECT_STREQ(idempotency_state_name(IdempotencyState::Replay), "replay");
    EXPECT_STREQ(idempotency_state_name(IdempotencyState::InProgress), "in_progress");
    EXPECT_STREQ(idempotency_state_name(IdempotencyState::Conflict), "conflict");
}
