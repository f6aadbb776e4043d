#pragma once
#include "connector.hpp"
#include "delivery.hpp"
#include "job_queue.hpp"
#include "router.hpp"
#include "worker.hpp"
#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct GatewayConfig {
    std::string db_path = "./data/gateway_jobs.db";
    int poll_ms = 250;
    double retry_delay_seconds = 10.0;
    int max_attempts = 3;
    int lease_seconds = 600;      // running jobs older than this are released
    int max_jobs_per_pass = 64;
    RouterConfig router;

    static GatewayConfig from_env();
};

struct DaemonOutcome {
    bool processed{false};
    int messages{0};
    int jobs_completed{0};
    int jobs_failed{0};     // terminal failures
    int jobs_retrying{0};   // parked in retry_wait
    std::vector<DeliveryReport> deliveries;
};

// Connector intake -> queue -> worker -> delivery, one pass at a time.
class NovaAgentDaemon {
public:
    NovaAgentDaemon(GatewayJobQueue& queue, JobRunner runner, GatewayConfig config = GatewayConfig());

    // Registered under its lowercased name(); replaces an existing one.
    void add_connector(std::shared_ptr<Connector> connector);
    std::shared_ptr<Connector> connector(const std::string& name) const;

    DaemonOutcome run_once();
    // Refuses to start when model credentials are in the environment. Loops
    // run_once until request_stop(), sleeping poll_ms when a pass was idle.
    void run_forever();
    void request_stop();

    GatewayWorker& worker() { return worker_; }
    DeliveryManager& delivery() { return delivery_; }
    const GatewayRouter& router() const { return router_; }
    nlohmann::json health() const;

private:
    int drain_connectors();
    void enqueue_message(const std::string& listener, const InboundMessage& message);

    GatewayConfig config_;
    GatewayJobQueue& queue_;
    GatewayWorker worker_;
    GatewayRouter router_;
    std::map<std::string, std::shared_ptr<Connector>> connectors_;
    mutable std::mutex connectors_mu_;
    DeliveryManager delivery_;

    std::atomic<bool> stop_{false};
    std::mutex stop_mu_;
    std::condition_variable stop_cv_;
};
