#pragma once
#include "execution_types.hpp"
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct DirectShellOptions {
    std::string transport{"native"};  // native | http | daemon | subprocess
    std::string binary{"directshell"};
    std::string http_url{"http://127.0.0.1:8765/execute"};
    std::string http_token;
    std::string daemon_socket;        // empty selects TCP host/port
    std::string daemon_host{"127.0.0.1"};
    int daemon_port{8766};
    std::string daemon_token;
    int timeout_seconds{30};

    // DIRECTSHELL_* environment variables over the defaults above.
    static DirectShellOptions from_env();
};

class DirectShellClient {
public:
    // Throws std::invalid_argument for an unknown transport, or for the
    // native transport without an executor.
    explicit DirectShellClient(DirectShellOptions opts, std::shared_ptr<ActionExecutor> native = nullptr);

    ExecutionResult execute_action(const nlohmann::json& action, bool dry_run = true);
    std::vector<ExecutionResult> run_plan(const nlohmann::json& actions, bool dry_run = true);

    // {ok, transport, status_code?, error?, capabilities?}
    nlohmann::json probe();

    const DirectShellOptions& options() const { return opts_; }

private:
    ExecutionResult execute_http(const nlohmann::json& action, bool dry_run);
    ExecutionResult execute_daemon(const nlohmann::json& action, bool dry_run);
    ExecutionResult execute_subprocess(const nlohmann::json& action, bool dry_run);
    nlohmann::json probe_http();
    nlohmann::json probe_daemon();

    // One request/response exchange with the socket daemon.
    bool daemon_exchange(const nlohmann::json& request, std::string& response, std::string& error);
    std::string health_url() const;

    DirectShellOptions opts_;
    std::shared_ptr<ActionExecutor> native_;
};
