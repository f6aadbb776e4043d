#include "delivery.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using json = nlohmann::json;

namespace {
class FlakyConnector : public Connector {
public:
    std::string name() const override { return "flaky"; }
    void listen(const Sink&) override {}
    void send(const json&, const std::string& content, const json&) override {
        if (failures_left-- > 0) throw std::runtime_error("channel offline");
        sent.push_back(content);
    }
    json health() override { return {{"ok", true}, {"channel", "flaky"}, {"enabled", true}}; }

    int failures_left{1};
    std::vector<std::string> sent;
};
}  // namespace

TEST(DeliveryManager, PartialFanOutIsReportedNotThrown) {
    TempDir dir;
    GatewayJobQueue q(dir.file("jobs.db"));
    std::string id = q.enqueue({{"objective", "x"}});

    std::vector<json> replies;
    auto cli = std::make_shared<CliConnector>("cli", [&](const json& reply_to, const std::string& content, const json&) {
        replies.push_back({{"to", reply_to["to"]}, {"content", content}});
    });
    DeliveryManager dm(q, [&](const std::string& name) -> std::shared_ptr<Connector> {
        return name == "cli" ? cli : nullptr;
    });
    dm.register_reply_target(id, "cli", "alice");
    dm.register_reply_target(id, "ghost", "bob");

    DeliveryReport r = dm.deliver(id, "hello");
    EXPECT_EQ(r.attempted, 2);
    EXPECT_EQ(r.sent, 1);
    EXPECT_EQ(r.failed, 1);
    EXPECT_FALSE(r.ok);
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0]["to"], "alice");
    EXPECT_EQ(replies[0]["content"], "hello");

    auto records = q.list_deliveries(id);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].connector, "cli");
    EXPECT_EQ(records[0].status, DeliveryStatus::Sent);
    EXPECT_EQ(records[1].connector, "ghost");
    EXPECT_EQ(records[1].status, DeliveryStatus::DeadLetter);
    EXPECT_EQ(records[1].last_error, "missing connector: ghost");

    // sent and dead-lettered targets are not retried
    EXPECT_EQ(dm.deliver(id, "again").attempted, 0);
}

TEST(DeliveryManager, FailedSendIsRetriedOnNextDelivery) {
    TempDir dir;
    GatewayJobQueue q(dir.file("jobs.db"));
    std::string id = q.enqueue({{"objective", "x"}});
    auto flaky = std::make_shared<FlakyConnector>();
    DeliveryManager dm(q, [&](const std::string&) -> std::shared_ptr<Connector> { return flaky; });
    dm.register_reply_target(id, "Flaky", "room-1");

    DeliveryReport first = dm.deliver(id, "result");
    EXPECT_EQ(first.failed, 1);
    auto records = q.list_deliveries(id);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].connector, "flaky");
    EXPECT_EQ(records[0].status, DeliveryStatus::Failed);
    EXPECT_EQ(records[0].last_error, "channel offline");

    DeliveryReport second = dm.deliver(id, "result");
    EXPECT_EQ(second.attempted, 1);
    EXPECT_EQ(second.sent, 1);
    EXPECT_TRUE(second.ok);
    EXPECT_EQ(flaky->sent, std::vector<std::string>{"result"});
}

TEST(DeliveryManager, NoTargetsIsTriviallyOk) {
    TempDir dir;
    GatewayJobQueue q(dir.file("jobs.db"));
    DeliveryManager dm(q, [](const std::string&) -> std::shared_ptr<Connector> { return nullptr; });
    DeliveryReport r = dm.deliver("missing-job", "x");
    EXPECT_EQ(r.attempted, 0);
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(r.to_json()["job_id"], "missing-job");
}
