#include "agent_daemon.hpp"
#include "guards.hpp"
#include "util.hpp"
#include <algorithm>
#include <chrono>
#include <spdlog/spdlog.h>
#include <stdexcept>

using json = nlohmann::json;

static std::string json_string(const json& obj, const char* key) {
    if (!obj.is_object()) return {};
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return {};
    return trim(it->get<std::string>());
}

static json message_to_json(const InboundMessage& m) {
    return {{"connector", m.connector}, {"sender", m.sender},     {"text", m.text},
            {"reply_to", m.reply_to},   {"metadata", m.metadata}, {"message_id", m.message_id}};
}

GatewayConfig GatewayConfig::from_env() {
    GatewayConfig c;
    c.db_path = getenv_or("NOVAAGENT_DB_PATH", c.db_path);
    c.poll_ms = std::max(10, getenv_int("NOVAAGENT_POLL_MS", c.poll_ms));
    c.retry_delay_seconds = getenv_double("NOVAAGENT_RETRY_DELAY_SECONDS", c.retry_delay_seconds);
    c.max_attempts = std::max(1, getenv_int("NOVAAGENT_MAX_ATTEMPTS", c.max_attempts));
    c.lease_seconds = getenv_int("NOVAAGENT_LEASE_SECONDS", c.lease_seconds);
    c.router = RouterConfig::from_env();
    return c;
}

NovaAgentDaemon::NovaAgentDaemon(GatewayJobQueue& queue, JobRunner runner, GatewayConfig config)
    : config_(std::move(config)),
      queue_(queue),
      worker_(queue, std::move(runner), config_.retry_delay_seconds, config_.max_attempts),
      router_(config_.router),
      delivery_(queue, [this](const std::string& name) { return connector(name); }) {
    if (config_.max_jobs_per_pass < 1) config_.max_jobs_per_pass = 1;
    if (config_.poll_ms < 1) config_.poll_ms = 1;
}

void NovaAgentDaemon::add_connector(std::shared_ptr<Connector> connector) {
    if (!connector) throw std::invalid_argument("connector must not be null");
    std::string name = to_lower(trim(connector->name()));
    if (name.empty()) throw std::invalid_argument("connector name must not be empty");
    std::lock_guard<std::mutex> lk(connectors_mu_);
    connectors_[name] = std::move(connector);
}

std::shared_ptr<Connector> NovaAgentDaemon::connector(const std::string& name) const {
    std::lock_guard<std::mutex> lk(connectors_mu_);
    auto it = connectors_.find(to_lower(trim(name)));
    return it == connectors_.end() ? nullptr : it->second;
}

json NovaAgentDaemon::health() const {
    json channels = json::object();
    std::lock_guard<std::mutex> lk(connectors_mu_);
    for (const auto& kv : connectors_) channels[kv.first] = kv.second->health();
    return {{"ok", true}, {"connectors", channels}};
}

void NovaAgentDaemon::enqueue_message(const std::string& listener, const InboundMessage& message) {
    std::string text = trim(message.text);
    if (text.empty()) return;

    InboundMessage routed = message;
    if (trim(routed.connector).empty()) routed.connector = listener;
    RoutingDecision decision = router_.route(routed);

    json reply_to = message.reply_to.is_object() ? message.reply_to : json::object();
    json payload = {
        {"objective", text},
        {"source", "connector:" + listener},
        {"session_id", message.message_id},
        {"meta", {{"connector_message", message_to_json(routed)}}},
    };
    std::string job_id = queue_.enqueue(payload, decision.workspace_id, decision.profile_name, reply_to);

    std::string target = json_string(reply_to, "connector");
    if (target.empty()) target = listener;
    std::string address = json_string(reply_to, "to");
    if (address.empty()) address = trim(message.sender);
    if (!address.empty()) {
        delivery_.register_reply_target(job_id, target, address, json_string(reply_to, "token"));
    }
    spdlog::info("[gateway] {} message -> job {} (workspace={}, profile={})", listener, job_id,
                 decision.workspace_id, decision.profile_name);
}

int NovaAgentDaemon::drain_connectors() {
    std::vector<std::pair<std::string, std::shared_ptr<Connector>>> snapshot;
    {
        std::lock_guard<std::mutex> lk(connectors_mu_);
        snapshot.assign(connectors_.begin(), connectors_.end());
    }
    int consumed = 0;
    for (const auto& entry : snapshot) {
        const std::string& name = entry.first;
        try {
            entry.second->listen([&](const InboundMessage& m) {
                ++consumed;
                try {
                    enqueue_message(name, m);
                } catch (const std::exception& e) {
                    spdlog::error("[gateway] dropping {} message {}: {}", name, m.message_id, e.what());
                }
            });
        } catch (const std::exception& e) {
            spdlog::warn("[gateway] connector {} listen failed: {}", name, e.what());
        }
    }
    return consumed;
}

DaemonOutcome NovaAgentDaemon::run_once() {
    DaemonOutcome outcome;
    outcome.messages = drain_connectors();

    for (int i = 0; i < config_.max_jobs_per_pass; ++i) {
        auto result = worker_.process_next();
        if (!result) break;
        const std::string& job_id = result->job.job_id;
        if (result->ok) {
            ++outcome.jobs_completed;
            outcome.deliveries.push_back(delivery_.deliver(job_id, result->output_text));
        } else if (result->status == JobStatus::Failed) {
            ++outcome.jobs_failed;
            outcome.deliveries.push_back(delivery_.deliver(job_id, "Job " + job_id + " failed: " + result->error));
        } else {
            ++outcome.jobs_retrying;
        }
    }

    outcome.processed = outcome.messages > 0 || outcome.jobs_completed > 0;
    return outcome;
}

void NovaAgentDaemon::run_forever() {
    assert_no_llm_env();
    spdlog::info("[gateway] running on {} (poll {} ms, max attempts {})", queue_.path(), config_.poll_ms,
                 config_.max_attempts);

    auto last_lease_check = std::chrono::steady_clock::time_point{};
    while (!stop_) {
        auto now = std::chrono::steady_clock::now();
        bool idle = true;
        try {
            if (config_.lease_seconds > 0 && now - last_lease_check >= std::chrono::seconds(60)) {
                queue_.release_stale_jobs(static_cast<std::int64_t>(config_.lease_seconds) * 1000);
                last_lease_check = now;
            }
            idle = !run_once().processed;
        } catch (const std::exception& e) {
            spdlog::error("[gateway] pass failed: {}", e.what());
        }
        if (!idle) continue;
        std::unique_lock<std::mutex> lk(stop_mu_);
        stop_cv_.wait_for(lk, std::chrono::milliseconds(config_.poll_ms), [this] { return stop_.load(); });
    }
    spdlog::info("[gateway] stopped");
}

void NovaAgentDaemon::request_stop() {
    {
        std::lock_guard<std::mutex> lk(stop_mu_);
        stop_ = true;
    }
    stop_cv_.notify_all();
}
