#pragma once
#include "execution_handler.hpp"
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

struct MHD_Daemon;

struct NativeHttpConfig {
    std::string host = "127.0.0.1";
    int port = 8765;  // 0 picks an ephemeral port
    std::string token;
    std::size_t max_body_bytes = 1 << 20;
    int drain_timeout_seconds = 30;  // bound on waiting for in-flight requests at shutdown
};

// HTTP front end for the desktop executor:
//   POST /execute      {action, dry_run} -> ExecutionResult JSON
//   GET  /health       {ok, service, transport}; ?deep=1 adds capabilities
class NativeExecutionHTTPServer {
public:
    NativeExecutionHTTPServer(NativeHttpConfig config, std::shared_ptr<ActionExecutor> executor);
    ~NativeExecutionHTTPServer();

    NativeExecutionHTTPServer(const NativeExecutionHTTPServer&) = delete;
    NativeExecutionHTTPServer& operator=(const NativeExecutionHTTPServer&) = delete;

    // Start the listener threads. Throws std::runtime_error on bind failure.
    void start();
    int port() const { return bound_port_; }

    // Blocks until shutdown(); starts the server first if needed.
    void serve_forever();
    // Stops accepting, lets in-flight requests finish (up to drain_timeout_seconds), then stops.
    void shutdown();

    const NativeHttpConfig& config() const { return config_; }
    ExecutionHandler& handler() { return handler_; }

private:
    NativeHttpConfig config_;
    ExecutionHandler handler_;
    MHD_Daemon* daemon_{nullptr};
    int bound_port_{0};

    std::mutex mu_;
    std::condition_variable stopped_cv_;
    bool stopped_{false};
};
