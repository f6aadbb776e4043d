#pragma once
#include "connector.hpp"
#include "job_queue.hpp"
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

struct DeliveryReport {
    std::string job_id;
    int attempted{0};
    int sent{0};
    int failed{0};
    bool ok{true};

    nlohmann::json to_json() const;
};

// Maps a connector name to a live connector, or nullptr when unknown.
using ConnectorResolver = std::function<std::shared_ptr<Connector>(const std::string& name)>;

class DeliveryManager {
public:
    DeliveryManager(GatewayJobQueue& queue, ConnectorResolver resolver);

    void register_reply_target(const std::string& job_id, const std::string& connector,
                               const std::string& address, const std::string& token = "");

    // Sends content to every pending or previously failed target of the job.
    // Per-target failures are recorded and counted, never thrown.
    DeliveryReport deliver(const std::string& job_id, const std::string& content,
                           const nlohmann::json& attachments = nlohmann::json::array());

private:
    GatewayJobQueue& queue_;
    ConnectorResolver resolver_;
};
