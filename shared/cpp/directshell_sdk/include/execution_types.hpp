#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// status is one of "ok", "preview" (dry run, no side effects) or "failed".
struct ExecutionResult {
    nlohmann::json action = nlohmann::json::object();
    std::string status;
    std::string output;

    bool ok() const { return status == "ok"; }
    nlohmann::json to_json() const;

    // Reads {status, output}; a missing status means "ok", a missing output
    // falls back to the raw body.
    static ExecutionResult from_response(const nlohmann::json& action,
                                         const nlohmann::json& body,
                                         const std::string& raw_body);
};

ExecutionResult make_result(const nlohmann::json& action, std::string status, std::string output);

// Anything that can carry out a single desktop action.
class ActionExecutor {
public:
    virtual ~ActionExecutor() = default;
    virtual ExecutionResult execute_action(const nlohmann::json& action, bool dry_run) = 0;
    // {ok, platform, capabilities, error?, ...}
    virtual nlohmann::json probe() = 0;
    virtual std::vector<std::string> capabilities() const = 0;
};
