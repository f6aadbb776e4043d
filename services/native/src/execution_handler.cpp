#include "execution_handler.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

using json = nlohmann::json;

// Length-independent compare so a wrong token leaks no prefix timing.
static bool constant_time_equals(const std::string& a, const std::string& b) {
    unsigned char diff = a.size() == b.size() ? 0 : 1;
    const std::string& ref = a.size() == b.size() ? b : a;
    for (size_t i = 0; i < a.size(); ++i) diff |= (unsigned char)(a[i] ^ ref[i]);
    return diff == 0;
}

ExecutionHandler::ExecutionHandler(std::shared_ptr<ActionExecutor> executor, std::string token, std::string transport)
    : executor_(std::move(executor)), token_(trim(token)), transport_(std::move(transport)) {
    if (!executor_) throw std::invalid_argument("ExecutionHandler requires an executor");
}

bool ExecutionHandler::authorized(const std::string& presented) const {
    if (token_.empty()) return true;
    return constant_time_equals(trim(presented), token_);
}

json ExecutionHandler::unauthorized() {
    return {{"status", "failed"}, {"output", "unauthorized"}, {"ok", false}, {"error", "unauthorized"}};
}

json ExecutionHandler::handle_execute(const json& body) {
    if (!body.is_object() || !body.contains("action") || !body["action"].is_object()) {
        throw std::invalid_argument("'action' must be a JSON object");
    }
    bool dry_run = false;
    auto it = body.find("dry_run");
    if (it != body.end() && it->is_boolean()) dry_run = it->get<bool>();
    const json& action = body["action"];
    ExecutionResult result = executor_->execute_action(action, dry_run);
    result.action = action;
    spdlog::info("{} execute type={} status={}", transport_, action.value("type", std::string()), result.status);
    return result.to_json();
}

json ExecutionHandler::handle_probe(bool deep) {
    json out = {{"ok", true}, {"transport", transport_}};
    if (!deep) return out;
    json p = executor_->probe();
    out["ok"] = p.value("ok", false);
    out["capabilities"] = executor_->capabilities();
    if (p.contains("platform")) out["platform"] = p["platform"];
    if (p.contains("error")) out["error"] = p["error"];
    return out;
}

json ExecutionHandler::handle_request(const json& request) {
    if (!request.is_object()) {
        return {{"status", "failed"}, {"output", "request must be a JSON object"}, {"ok", false}};
    }
    std::string presented;
    auto tok = request.find("token");
    if (tok != request.end() && tok->is_string()) presented = tok->get<std::string>();
    if (!authorized(presented)) {
        spdlog::warn("{} request rejected: unauthorized", transport_);
        return unauthorized();
    }

    std::string op = "execute";
    auto it = request.find("op");
    if (it != request.end() && it->is_string()) op = to_lower(trim(it->get<std::string>()));

    if (op == "probe") {
        auto d = request.find("deep");
        return handle_probe(d != request.end() && d->is_boolean() && d->get<bool>());
    }
    if (op != "execute") {
        return {{"status", "failed"}, {"output", "unsupported op '" + op + "'"}, {"ok", false}};
    }
    try {
        return handle_execute(request);
    } catch (const std::invalid_argument& e) {
        json action = request.contains("action") ? request["action"] : json::object();
        return {{"action", action}, {"status", "failed"}, {"output", e.what()}};
    }
}
