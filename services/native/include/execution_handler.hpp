#pragma once
#include "execution_types.hpp"
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

// Transport-neutral request handling shared by the socket daemon and the HTTP
// server. An empty token disables authentication.
class ExecutionHandler {
public:
    ExecutionHandler(std::shared_ptr<ActionExecutor> executor, std::string token, std::string transport);

    bool authorized(const std::string& presented) const;
    bool requires_token() const { return !token_.empty(); }

    // {action, dry_run} -> ExecutionResult JSON. Throws std::invalid_argument
    // when action is not an object.
    nlohmann::json handle_execute(const nlohmann::json& body);
    nlohmann::json handle_probe(bool deep);

    // Socket requests: {op?, action, dry_run, token, deep}. Always returns a
    // JSON object; bad requests and auth failures come back as failed results.
    nlohmann::json handle_request(const nlohmann::json& request);

    static nlohmann::json unauthorized();

    const std::string& transport() const { return transport_; }

private:
    std::shared_ptr<ActionExecutor> executor_;
    std::string token_;
    std::string transport_;
};
