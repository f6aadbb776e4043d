#include "worker.hpp"
#include "util.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include <stdexcept>

using json = nlohmann::json;

GatewayWorker::GatewayWorker(GatewayJobQueue& queue, JobRunner runner, double retry_delay_seconds, int max_attempts)
    : queue_(queue),
      runner_(std::move(runner)),
      retry_delay_seconds_(std::max(0.0, retry_delay_seconds)),
      max_attempts_(std::max(1, max_attempts)) {
    if (!runner_) throw std::invalid_argument("GatewayWorker requires a job runner");
}

std::string GatewayWorker::extract_output_text(const json& result) {
    if (result.is_object()) {
        for (const char* key : {"output_text", "final_text", "content", "output"}) {
            auto it = result.find(key);
            if (it == result.end() || it->is_null()) continue;
            std::string text = trim(it->is_string() ? it->get<std::string>() : it->dump());
            if (!text.empty()) return text;
        }
    }
    if (result.is_string()) return result.get<std::string>();
    return result.is_null() ? std::string() : result.dump();
}

std::optional<WorkerOutcome> GatewayWorker::process_next() {
    auto job = queue_.claim_next();
    if (!job) return std::nullopt;

    WorkerOutcome out;
    out.job = *job;
    try {
        out.result = runner_(*job);
        if (out.result.is_object() && out.result.contains("ok") && out.result["ok"].is_boolean() &&
            !out.result["ok"].get<bool>()) {
            std::string err;
            if (out.result.contains("error")) {
                const json& e = out.result["error"];
                err = e.is_string() ? e.get<std::string>() : e.dump();
            }
            throw std::runtime_error(err.empty() ? "runner reported ok=false" : err);
        }
        queue_.mark_done(job->job_id, out.result);
        out.ok = true;
        out.status = JobStatus::Done;
        out.output_text = extract_output_text(out.result);
        spdlog::info("[gateway] job {} done", job->job_id);
    } catch (const std::exception& e) {
        out.ok = false;
        out.error = e.what();
        out.status = queue_.mark_failed(job->job_id, retry_delay_seconds_, max_attempts_, out.error);
        spdlog::warn("[gateway] job {} attempt {} failed ({}): {}", job->job_id, job->attempts + 1,
                     job_status_name(out.status), out.error);
    }
    return out;
}
