#include "job.hpp"
#include "util.hpp"

using json = nlohmann::json;

const char* job_status_name(JobStatus s) {
    switch (s) {
        case JobStatus::Queued: return "queued";
        case JobStatus::Running: return "running";
        case JobStatus::RetryWait: return "retry_wait";
        case JobStatus::Done: return "done";
        case JobStatus::Failed: return "failed";
    }
    return "queued";
}

std::optional<JobStatus> parse_job_status(const std::string& name) {
    std::string n = to_lower(trim(name));
    if (n == "queued") return JobStatus::Queued;
    if (n == "running") return JobStatus::Running;
    if (n == "retry_wait") return JobStatus::RetryWait;
    if (n == "done") return JobStatus::Done;
    if (n == "failed") return JobStatus::Failed;
    return std::nullopt;
}

const char* delivery_status_name(DeliveryStatus s) {
    switch (s) {
        case DeliveryStatus::Pending: return "pending";
        case DeliveryStatus::Sent: return "sent";
        case DeliveryStatus::Failed: return "failed";
        case DeliveryStatus::DeadLetter: return "dead_letter";
    }
    return "pending";
}

std::optional<DeliveryStatus> parse_delivery_status(const std::string& name) {
    std::string n = to_lower(trim(name));
    if (n == "pending") return DeliveryStatus::Pending;
    if (n == "sent") return DeliveryStatus::Sent;
    if (n == "failed") return DeliveryStatus::Failed;
    if (n == "dead_letter") return DeliveryStatus::DeadLetter;
    return std::nullopt;
}

std::string GatewayJob::objective() const {
    if (!payload.is_object()) return {};
    for (const char* key : {"objective", "input_text"}) {
        auto it = payload.find(key);
        if (it != payload.end() && it->is_string()) {
            std::string v = trim(it->get<std::string>());
            if (!v.empty()) return v;
        }
    }
    return {};
}

json GatewayJob::to_json() const {
    json j = {
        {"job_id", job_id},
        {"status", job_status_name(status)},
        {"payload", payload},
        {"workspace_id", workspace_id},
        {"profile_name", profile_name},
        {"reply_to", reply_to},
        {"attempts", attempts},
        {"next_eligible_at", iso8601_utc(next_eligible_ms)},
        {"created_at", iso8601_utc(created_ms)},
        {"updated_at", iso8601_utc(updated_ms)},
        {"last_error", last_error},
        {"result", result},
    };
    if (!parent_job_id.empty()) j["parent_job_id"] = parent_job_id;
    return j;
}
