#include "agent_daemon.hpp"
#include "directshell_client.hpp"
#include "logging.hpp"
#include "native_executor.hpp"
#include "util.hpp"
#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <pthread.h>
#include <spdlog/spdlog.h>
#include <string>
#include <thread>
#include <unistd.h>

using json = nlohmann::json;

// Executes the job's "actions" plan through DirectShell, or records the
// objective as a note when the payload carries no plan.
static json run_with_directshell(DirectShellClient& client, const GatewayJob& job) {
    json actions = job.payload.contains("actions") ? job.payload["actions"] : json();
    if (!actions.is_array() || actions.empty()) {
        actions = json::array({{{"type", "note"}, {"target", "objective"}, {"value", job.objective()}}});
    }
    bool dry_run = true;
    if (job.payload.contains("dry_run") && job.payload["dry_run"].is_boolean()) {
        dry_run = job.payload["dry_run"].get<bool>();
    }

    json results = json::array();
    std::string text;
    bool ok = true;
    for (const auto& r : client.run_plan(actions, dry_run)) {
        results.push_back(r.to_json());
        if (r.status == "failed") ok = false;
        if (!text.empty()) text += "\n";
        text += r.status + ": " + r.output;
    }
    json out = {{"ok", ok}, {"output_text", text}, {"results", results}, {"dry_run", dry_run}};
    if (!ok) out["error"] = text;
    return out;
}

int main(int argc, char** argv) {
    init_logging("gateway", getenv_or("NOVAADAPT_LOG_LEVEL", "info"));

    GatewayConfig cfg = GatewayConfig::from_env();
    for (int i = 1; i + 1 < argc; i += 2) {
        std::string flag = argv[i];
        std::string value = argv[i + 1];
        if (flag == "--db") cfg.db_path = value;
        else if (flag == "--poll-ms") cfg.poll_ms = std::max(10, std::atoi(value.c_str()));
        else if (flag == "--max-attempts") cfg.max_attempts = std::max(1, std::atoi(value.c_str()));
        else {
            std::cerr << "usage: novaagent-gateway [--db PATH] [--poll-ms N] [--max-attempts N]\n";
            return 2;
        }
    }

    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);

    try {
        DirectShellOptions ds = DirectShellOptions::from_env();
        std::shared_ptr<ActionExecutor> native;
        if (ds.transport == "native") native = std::make_shared<NativeDesktopExecutor>();
        auto client = std::make_shared<DirectShellClient>(ds, native);

        GatewayJobQueue queue(cfg.db_path);
        NovaAgentDaemon daemon(queue, [client](const GatewayJob& job) { return run_with_directshell(*client, job); },
                               cfg);

        auto cli = std::make_shared<CliConnector>("cli", [](const json&, const std::string& content, const json&) {
            std::cout << content << std::endl;
        });
        daemon.add_connector(cli);
        spdlog::info("[gateway] started with {}", daemon.health().dump());

        // Lines typed on stdin become inbound messages until EOF.
        std::thread([cli] {
            std::string line;
            while (std::getline(std::cin, line)) {
                if (!trim(line).empty()) cli->push_inbound(line);
            }
        }).detach();

        int rc = 0;
        std::thread runner([&] {
            try {
                daemon.run_forever();
            } catch (const std::exception& e) {
                spdlog::error("[gateway] {}", e.what());
                rc = 1;
                kill(getpid(), SIGTERM);
            }
        });
        int sig = 0;
        sigwait(&set, &sig);
        daemon.request_stop();
        runner.join();
        if (std::size_t left = cli->pending()) spdlog::warn("[gateway] {} queued cli message(s) not processed", left);
        return rc;
    } catch (const std::exception& e) {
        spdlog::error("[gateway] startup failed: {}", e.what());
        return 1;
    }
}
