#pragma once
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

enum class JobStatus { Queued, Running, RetryWait, Done, Failed };

const char* job_status_name(JobStatus s);
std::optional<JobStatus> parse_job_status(const std::string& name);

struct GatewayJob {
    std::string job_id;
    JobStatus status{JobStatus::Queued};
    nlohmann::json payload = nlohmann::json::object();
    std::string workspace_id;
    std::string profile_name;
    nlohmann::json reply_to = nlohmann::json::object();
    int attempts{0};
    std::int64_t next_eligible_ms{0};
    std::int64_t created_ms{0};
    std::int64_t updated_ms{0};
    std::string last_error;
    nlohmann::json result;  // null until done
    std::string parent_job_id;

    std::string objective() const;
    nlohmann::json to_json() const;
};

enum class DeliveryStatus { Pending, Sent, Failed, DeadLetter };

const char* delivery_status_name(DeliveryStatus s);
std::optional<DeliveryStatus> parse_delivery_status(const std::string& name);

struct DeliveryRecord {
    std::string job_id;
    std::string connector;
    std::string address;
    std::string token;
    DeliveryStatus status{DeliveryStatus::Pending};
    std::string last_error;
    std::int64_t last_attempt_ms{0};
};
