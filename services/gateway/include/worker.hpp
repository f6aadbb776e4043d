#pragma once
#include "job_queue.hpp"
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// Executes one job. A result with "ok": false, or an exception, counts as
// a failure.
using JobRunner = std::function<nlohmann::json(const GatewayJob&)>;

struct WorkerOutcome {
    GatewayJob job;
    bool ok{false};
    std::string output_text;
    nlohmann::json result;
    std::string error;
    JobStatus status{JobStatus::Queued};  // status after this attempt
};

class GatewayWorker {
public:
    GatewayWorker(GatewayJobQueue& queue, JobRunner runner, double retry_delay_seconds = 10.0,
                  int max_attempts = 3);

    // Claims and runs one job; nullopt when nothing is claimable.
    std::optional<WorkerOutcome> process_next();

    GatewayJobQueue& queue() { return queue_; }

    // First non-empty of output_text, final_text, content, output; else the
    // compact JSON of the whole result.
    static std::string extract_output_text(const nlohmann::json& result);

private:
    GatewayJobQueue& queue_;
    JobRunner runner_;
    double retry_delay_seconds_;
    int max_attempts_;
};
