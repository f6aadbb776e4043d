#include "logging.hpp"
#include "native_daemon.hpp"
#include "native_executor.hpp"
#include "native_http.hpp"
#include "util.hpp"
#include <csignal>
#include <cstdio>
#include <map>
#include <pthread.h>
#include <spdlog/spdlog.h>
#include <string>
#include <thread>
#include <unistd.h>

static void usage() {
    std::fprintf(stderr,
                 "usage: novaadapt-native [--mode daemon|http] [--socket PATH] [--host HOST] [--port N]\n"
                 "                        [--token TOKEN] [--timeout SECONDS] [--max-body-bytes N]\n");
}

static int to_int(const std::string& raw, int def) {
    try {
        return std::stoi(raw);
    } catch (const std::exception&) {
        spdlog::warn("ignoring malformed number '{}', using {}", raw, def);
        return def;
    }
}

// Runs `serve` on a worker thread and returns once SIGINT/SIGTERM arrives
// and `stop` has completed.
template <typename Serve, typename Stop>
static int serve_until_signal(Serve serve, Stop stop) {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);

    int rc = 0;
    std::thread worker([&] {
        try {
            serve();
        } catch (const std::exception& e) {
            spdlog::error("server failed: {}", e.what());
            rc = 1;
            kill(getpid(), SIGTERM);
        }
    });
    int sig = 0;
    sigwait(&set, &sig);
    spdlog::info("received signal {}, shutting down", sig);
    stop();
    worker.join();
    return rc;
}

int main(int argc, char** argv) {
    std::map<std::string, std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-h" || a == "--help") {
            usage();
            return 0;
        }
        if (a.rfind("--", 0) != 0 || i + 1 >= argc) {
            usage();
            return 2;
        }
        args[a.substr(2)] = argv[++i];
    }
    auto arg = [&](const std::string& k, const std::string& def) {
        auto it = args.find(k);
        return it == args.end() ? def : it->second;
    };

    std::string mode = to_lower(arg("mode", "daemon"));
    init_logging(mode == "http" ? "native-http" : "native-daemon", getenv_or("NOVAADAPT_LOG_LEVEL", "info"));

    int timeout = to_int(arg("timeout", "30"), 30);
    auto executor = std::make_shared<NativeDesktopExecutor>(NativeDesktopExecutor::default_platform_name(), timeout);

    try {
        if (mode == "http") {
            NativeHttpConfig cfg;
            cfg.host = arg("host", cfg.host);
            cfg.port = to_int(arg("port", "8765"), 8765);
            cfg.token = arg("token", getenv_or("DIRECTSHELL_HTTP_TOKEN", ""));
            int max_body = to_int(arg("max-body-bytes", std::to_string(cfg.max_body_bytes)), (int)cfg.max_body_bytes);
            if (max_body > 0) cfg.max_body_bytes = (std::size_t)max_body;
            cfg.drain_timeout_seconds = timeout;
            NativeExecutionHTTPServer server(cfg, executor);
            server.start();
            return serve_until_signal([&] { server.serve_forever(); }, [&] { server.shutdown(); });
        }
        if (mode == "daemon") {
            NativeDaemonConfig cfg;
            cfg.socket_path = arg("socket", "");
            cfg.host = arg("host", cfg.host);
            cfg.port = to_int(arg("port", "8766"), 8766);
            cfg.token = arg("token", getenv_or("DIRECTSHELL_DAEMON_TOKEN", ""));
            cfg.timeout_seconds = timeout;
            NativeExecutionDaemon daemon(cfg, executor);
            daemon.listen();
            return serve_until_signal([&] { daemon.serve_forever(); }, [&] { daemon.shutdown(); });
        }
    } catch (const std::exception& e) {
        spdlog::error("startup failed: {}", e.what());
        return 1;
    }
    usage();
    return 2;
}
