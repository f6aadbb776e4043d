#include "delivery.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

using json = nlohmann::json;

json DeliveryReport::to_json() const {
    return {{"ok", ok}, {"job_id", job_id}, {"attempted", attempted}, {"sent", sent}, {"failed", failed}};
}

DeliveryManager::DeliveryManager(GatewayJobQueue& queue, ConnectorResolver resolver)
    : queue_(queue), resolver_(std::move(resolver)) {
    if (!resolver_) throw std::invalid_argument("DeliveryManager requires a connector resolver");
}

void DeliveryManager::register_reply_target(const std::string& job_id, const std::string& connector,
                                            const std::string& address, const std::string& token) {
    queue_.upsert_delivery(job_id, to_lower(trim(connector)), trim(address), trim(token));
}

DeliveryReport DeliveryManager::deliver(const std::string& job_id, const std::string& content,
                                        const json& attachments) {
    DeliveryReport report;
    report.job_id = job_id;
    auto targets = queue_.list_pending_deliveries(job_id);
    report.attempted = static_cast<int>(targets.size());

    for (const auto& t : targets) {
        std::string name = to_lower(trim(t.connector));
        std::shared_ptr<Connector> connector = resolver_(name);
        if (!connector) {
            ++report.failed;
            queue_.mark_delivery(job_id, t.connector, t.address, DeliveryStatus::DeadLetter,
                                 "missing connector: " + name);
            spdlog::warn("[gateway] job {} target {}:{} dead-lettered: missing connector", job_id, name, t.address);
            continue;
        }
        try {
            connector->send({{"connector", name}, {"to", t.address}, {"token", t.token}}, content,
                            attachments.is_array() ? attachments : json::array());
            ++report.sent;
            queue_.mark_delivery(job_id, t.connector, t.address, DeliveryStatus::Sent);
        } catch (const std::exception& e) {
            ++report.failed;
            queue_.mark_delivery(job_id, t.connector, t.address, DeliveryStatus::Failed, e.what());
            spdlog::warn("[gateway] job {} delivery to {}:{} failed: {}", job_id, name, t.address, e.what());
        }
    }
    report.ok = report.failed == 0;
    return report;
}
