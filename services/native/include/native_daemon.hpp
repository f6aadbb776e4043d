#pragma once
#include "execution_handler.hpp"
#include <atomic>
#include <condition_variable>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

struct NativeDaemonConfig {
    // Non-empty selects a Unix domain socket; otherwise host:port over TCP.
    std::string socket_path;
    std::string host = "127.0.0.1";
    int port = 8766;  // 0 picks an ephemeral port
    std::string token;
    int timeout_seconds = 30;
};

// Framed JSON execution service. One thread per connection; a connection
// may carry any number of requests until the peer closes or goes idle for
// timeout_seconds.
class NativeExecutionDaemon {
public:
    NativeExecutionDaemon(NativeDaemonConfig config, std::shared_ptr<ActionExecutor> executor);
    ~NativeExecutionDaemon();

    NativeExecutionDaemon(const NativeExecutionDaemon&) = delete;
    NativeExecutionDaemon& operator=(const NativeExecutionDaemon&) = delete;

    // Bind and listen. Throws std::runtime_error on failure.
    void listen();
    // Bound TCP port (after listen), or 0 for a Unix socket.
    int port() const { return bound_port_; }
    std::string endpoint() const;

    // Accept loop; returns after shutdown(). Calls listen() if needed.
    void serve_forever();
    // Stop accepting, close idle connections, join in-flight ones and remove
    // the socket file. Safe to call from any thread, more than once.
    void shutdown();

private:
    struct Connection {
        int fd{-1};
        std::thread thread;
        std::atomic<bool> done{false};
    };

    void listen_unix();
    void listen_tcp();
    void handle_connection(Connection* conn);
    void reap_finished();
    void close_all_connections();

    NativeDaemonConfig config_;
    ExecutionHandler handler_;
    int listen_fd_{-1};
    int wake_pipe_[2]{-1, -1};
    int bound_port_{0};

    std::atomic<bool> stopping_{false};
    std::mutex mu_;
    std::condition_variable serving_cv_;
    bool serving_{false};
    bool closed_{false};
    std::list<std::unique_ptr<Connection>> connections_;
};
