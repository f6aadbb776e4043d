#include "native_http.hpp"
#include "util.hpp"
#include <algorithm>
#include <arpa/inet.h>
#include <chrono>
#include <cstring>
#include <microhttpd.h>
#include <netinet/in.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <thread>
#include <unistd.h>

#if MHD_VERSION >= 0x00097002
#define MHD_RESULT enum MHD_Result
#else
#define MHD_RESULT int
#endif

using json = nlohmann::json;

struct ConnInfo {
    std::string method;
    std::string url;
    std::string body;
    bool too_large{false};
};

static MHD_RESULT send_json(struct MHD_Connection* conn, unsigned int status, const json& payload) {
    std::string body = payload.dump();
    struct MHD_Response* resp =
        MHD_create_response_from_buffer(body.size(), (void*)body.data(), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, "application/json");
    MHD_RESULT ret = MHD_queue_response(conn, status, resp);
    MHD_destroy_response(resp);
    return ret;
}

static std::string header(struct MHD_Connection* conn, const char* name) {
    const char* v = MHD_lookup_connection_value(conn, MHD_HEADER_KIND, name);
    return v ? std::string(v) : std::string();
}

static bool request_authorized(struct MHD_Connection* conn, const ExecutionHandler& handler) {
    if (!handler.requires_token()) return true;
    std::string direct = header(conn, "X-DirectShell-Token");
    if (!direct.empty() && handler.authorized(direct)) return true;
    std::string auth = trim(header(conn, MHD_HTTP_HEADER_AUTHORIZATION));
    if (auth.size() > 7 && to_lower(auth.substr(0, 7)) == "bearer ") {
        return handler.authorized(auth.substr(7));
    }
    return false;
}

static MHD_RESULT handle(void* cls, struct MHD_Connection* connection, const char* url, const char* method,
                  const char* /*version*/, const char* upload_data, size_t* upload_data_size, void** con_cls) {
    auto* server = static_cast<NativeExecutionHTTPServer*>(cls);
    ConnInfo* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) {
        ci = new ConnInfo{method, url, {}, false};
        *con_cls = ci;
        return MHD_YES;
    }

    if (0 == strcmp(method, MHD_HTTP_METHOD_POST) && *upload_data_size) {
        if (!ci->too_large) {
            if (ci->body.size() + *upload_data_size > server->config().max_body_bytes) {
                ci->too_large = true;
                ci->body.clear();
            } else {
                ci->body.append(upload_data, *upload_data_size);
            }
        }
        *upload_data_size = 0;
        return MHD_YES;
    }

    ExecutionHandler& handler = server->handler();
    const std::string& path = ci->url;
    try {
        if (ci->method == "GET" && path == "/health") {
            if (!request_authorized(connection, handler)) {
                return send_json(connection, MHD_HTTP_UNAUTHORIZED, {{"ok", false}, {"error", "unauthorized"}});
            }
            const char* deep = MHD_lookup_connection_value(connection, MHD_GET_ARGUMENT_KIND, "deep");
            json out = {{"ok", true}, {"service", "novaadapt-native-http"}, {"transport", "http"}};
            if (deep && trim(deep) == "1") {
                json probe = handler.handle_probe(true);
                out["capabilities"] = probe.value("capabilities", json::array());
            }
            return send_json(connection, MHD_HTTP_OK, out);
        }
        if (ci->method == "POST" && path == "/execute") {
            if (!request_authorized(connection, handler)) {
                spdlog::warn("[native-http] rejected unauthorized execute");
                return send_json(connection, MHD_HTTP_UNAUTHORIZED, {{"ok", false}, {"error", "unauthorized"}});
            }
            if (ci->too_large) {
                return send_json(connection, MHD_HTTP_PAYLOAD_TOO_LARGE,
                                 {{"status", "failed"}, {"output", "payload too large"}});
            }
            json body = json::parse(ci->body, nullptr, false);
            if (body.is_discarded()) {
                return send_json(connection, MHD_HTTP_BAD_REQUEST, {{"status", "failed"}, {"output", "invalid json"}});
            }
            if (!body.is_object() || !body.contains("action") || !body["action"].is_object()) {
                return send_json(connection, MHD_HTTP_BAD_REQUEST,
                                 {{"status", "failed"}, {"output", "payload must include object field 'action'"}});
            }
            return send_json(connection, MHD_HTTP_OK, handler.handle_execute(body));
        }
        if (ci->method == "GET") {
            return send_json(connection, MHD_HTTP_NOT_FOUND, {{"ok", false}, {"error", "not found"}});
        }
        return send_json(connection, MHD_HTTP_NOT_FOUND, {{"status", "failed"}, {"output", "not found"}});
    } catch (const std::exception& e) {
        spdlog::error("[native-http] {} {} failed: {}", ci->method, path, e.what());
        return send_json(connection, MHD_HTTP_INTERNAL_SERVER_ERROR,
                         {{"status", "failed"}, {"output", std::string("Native execution error: ") + e.what()}});
    }
}

static void request_completed(void* /*cls*/, struct MHD_Connection* /*connection*/, void** con_cls,
                       enum MHD_RequestTerminationCode /*toe*/) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}

NativeExecutionHTTPServer::NativeExecutionHTTPServer(NativeHttpConfig config, std::shared_ptr<ActionExecutor> executor)
    : config_(std::move(config)), handler_(std::move(executor), config_.token, "http") {
    if (config_.max_body_bytes == 0) config_.max_body_bytes = 1 << 20;
}

NativeExecutionHTTPServer::~NativeExecutionHTTPServer() {
    shutdown();
}

void NativeExecutionHTTPServer::start() {
    std::lock_guard<std::mutex> lk(mu_);
    if (daemon_) return;
    if (stopped_) throw std::runtime_error("HTTP server has been shut down");

    struct sockaddr_in addr {};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(config_.port));
    std::string host = trim(config_.host);
    if (host.empty() || host == "0.0.0.0") {
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
    } else if (host == "localhost") {
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    } else if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        throw std::runtime_error("invalid IPv4 listen address: " + host);
    }

    daemon_ = MHD_start_daemon(MHD_USE_THREAD_PER_CONNECTION | MHD_USE_INTERNAL_POLLING_THREAD | MHD_USE_ITC,
                               static_cast<uint16_t>(config_.port), nullptr, nullptr, &handle, this,
                               MHD_OPTION_SOCK_ADDR, reinterpret_cast<struct sockaddr*>(&addr),
                               MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                               MHD_OPTION_END);
    if (!daemon_) {
        throw std::runtime_error("failed to start HTTP server on " + host + ":" + std::to_string(config_.port));
    }
    const union MHD_DaemonInfo* info = MHD_get_daemon_info(daemon_, MHD_DAEMON_INFO_BIND_PORT);
    bound_port_ = info ? info->port : config_.port;
    spdlog::info("[native-http] listening on {}:{} (auth {})", host, bound_port_,
                 handler_.requires_token() ? "token" : "open");
}

void NativeExecutionHTTPServer::serve_forever() {
    start();
    std::unique_lock<std::mutex> lk(mu_);
    stopped_cv_.wait(lk, [this] { return stopped_; });
}

void NativeExecutionHTTPServer::shutdown() {
    MHD_Daemon* d = nullptr;
    {
        std::lock_guard<std::mutex> lk(mu_);
        stopped_ = true;
        d = daemon_;
        daemon_ = nullptr;
    }
    stopped_cv_.notify_all();
    if (!d) return;
    MHD_socket listen_fd = MHD_quiesce_daemon(d);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(std::max(0, config_.drain_timeout_seconds));
    for (;;) {
        const union MHD_DaemonInfo* info = MHD_get_daemon_info(d, MHD_DAEMON_INFO_CURRENT_CONNECTIONS);
        if (!info || info->num_connections == 0) break;
        if (std::chrono::steady_clock::now() >= deadline) {
            spdlog::warn("[native-http] {} connection(s) still open after drain timeout", info->num_connections);
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    MHD_stop_daemon(d);
    if (listen_fd != MHD_INVALID_SOCKET) ::close(listen_fd);
    spdlog::info("[native-http] stopped");
}
