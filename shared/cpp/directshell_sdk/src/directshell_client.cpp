#include "directshell_client.hpp"
#include "frame_io.hpp"
#include "process.hpp"
#include "util.hpp"
#include <curl/curl.h>
#include <mutex>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <unistd.h>

using json = nlohmann::json;

static size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

struct CurlHandle {
    CURL* h{nullptr};
    struct curl_slist* headers{nullptr};
    CurlHandle() {
        static std::once_flag init;
        std::call_once(init, []{ curl_global_init(CURL_GLOBAL_DEFAULT); });
        h = curl_easy_init();
        if (!h) throw std::runtime_error("curl_easy_init failed");
    }
    ~CurlHandle() {
        if (headers) curl_slist_free_all(headers);
        if (h) curl_easy_cleanup(h);
    }
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

struct HttpReply {
    CURLcode code{CURLE_OK};
    long status{0};
    std::string body;
};

static HttpReply http_request(const std::string& url, const std::string* post_body,
                       const std::string& token, int timeout_seconds) {
    CurlHandle c;
    HttpReply reply;
    c.headers = curl_slist_append(c.headers, "Content-Type: application/json");
    if (!token.empty()) {
        c.headers = curl_slist_append(c.headers, ("Authorization: Bearer " + token).c_str());
        c.headers = curl_slist_append(c.headers, ("X-DirectShell-Token: " + token).c_str());
    }
    curl_easy_setopt(c.h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, c.headers);
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &reply.body);
    curl_easy_setopt(c.h, CURLOPT_TIMEOUT_MS, (long)timeout_seconds * 1000L);
    curl_easy_setopt(c.h, CURLOPT_NOSIGNAL, 1L);
    if (post_body) {
        curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, post_body->c_str());
        curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE, (long)post_body->size());
    }
    reply.code = curl_easy_perform(c.h);
    if (reply.code == CURLE_OK) curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &reply.status);
    return reply;
}

static json parse_or_null(const std::string& raw) {
    return json::parse(raw, nullptr, false);
}

DirectShellOptions DirectShellOptions::from_env() {
    DirectShellOptions o;
    o.transport = to_lower(trim(getenv_or("DIRECTSHELL_TRANSPORT", o.transport)));
    o.binary = getenv_or("DIRECTSHELL_BIN", o.binary);
    o.http_url = getenv_or("DIRECTSHELL_HTTP_URL", o.http_url);
    o.http_token = trim(getenv_or("DIRECTSHELL_HTTP_TOKEN", ""));
    o.daemon_socket = getenv_or("DIRECTSHELL_DAEMON_SOCKET", "/tmp/directshell.sock");
    o.daemon_host = getenv_or("DIRECTSHELL_DAEMON_HOST", o.daemon_host);
    o.daemon_port = getenv_int("DIRECTSHELL_DAEMON_PORT", o.daemon_port);
    o.daemon_token = trim(getenv_or("DIRECTSHELL_DAEMON_TOKEN", ""));
    o.timeout_seconds = getenv_int("DIRECTSHELL_TIMEOUT_SECONDS", o.timeout_seconds);
    return o;
}

DirectShellClient::DirectShellClient(DirectShellOptions opts, std::shared_ptr<ActionExecutor> native)
    : opts_(std::move(opts)), native_(std::move(native)) {
    opts_.transport = to_lower(trim(opts_.transport));
    if (opts_.timeout_seconds < 1) opts_.timeout_seconds = 1;
    const auto& t = opts_.transport;
    if (t != "native" && t != "http" && t != "daemon" && t != "subprocess") {
        throw std::invalid_argument("Unsupported DirectShell transport '" + t +
                                    "'. Use 'native', 'http', 'daemon', or 'subprocess'.");
    }
    if (t == "native" && !native_) {
        throw std::invalid_argument("DirectShell native transport requires an executor");
    }
}

ExecutionResult DirectShellClient::execute_action(const json& action, bool dry_run) {
    if (!action.is_object()) {
        throw std::invalid_argument("action must be a JSON object");
    }
    spdlog::debug("directshell {} action={} dry_run={}", opts_.transport, action.dump(), dry_run);
    if (opts_.transport == "native") {
        auto r = native_->execute_action(action, dry_run);
        r.action = action;
        return r;
    }
    if (opts_.transport == "http") return execute_http(action, dry_run);
    if (opts_.transport == "daemon") return execute_daemon(action, dry_run);
    return execute_subprocess(action, dry_run);
}

std::vector<ExecutionResult> DirectShellClient::run_plan(const json& actions, bool dry_run) {
    if (!actions.is_array()) {
        throw std::invalid_argument("plan must be a JSON array of actions");
    }
    std::vector<ExecutionResult> out;
    out.reserve(actions.size());
    for (const auto& a : actions) out.push_back(execute_action(a, dry_run));
    return out;
}

json DirectShellClient::probe() {
    if (opts_.transport == "native") {
        json p = native_->probe();
        p["transport"] = "native";
        return p;
    }
    if (opts_.transport == "http") return probe_http();
    if (opts_.transport == "daemon") return probe_daemon();

    auto r = run_capture({opts_.binary, "--version"}, (std::uint32_t)opts_.timeout_seconds * 1000u);
    json p = {{"ok", r.ok}, {"transport", "subprocess"}, {"binary", opts_.binary}};
    if (!r.ok) p["error"] = r.error.empty() ? trim(r.err) : r.error;
    return p;
}

ExecutionResult DirectShellClient::execute_http(const json& action, bool dry_run) {
    std::string body = json{{"action", action}, {"dry_run", dry_run}}.dump();
    HttpReply reply;
    try {
        reply = http_request(opts_.http_url, &body, opts_.http_token, opts_.timeout_seconds);
    } catch (const std::exception& e) {
        return make_result(action, "failed", std::string("HTTP transport error: ") + e.what());
    }
    if (reply.code != CURLE_OK) {
        return make_result(action, "failed", std::string("HTTP transport error: ") + curl_easy_strerror(reply.code));
    }
    if (reply.status >= 400) {
        return make_result(action, "failed", "HTTP " + std::to_string(reply.status) + ": " + reply.body);
    }
    return ExecutionResult::from_response(action, parse_or_null(reply.body), trim(reply.body));
}

ExecutionResult DirectShellClient::execute_daemon(const json& action, bool dry_run) {
    json request = {{"op", "execute"}, {"action", action}, {"dry_run", dry_run}};
    if (!opts_.daemon_token.empty()) request["token"] = opts_.daemon_token;
    std::string raw, error;
    if (!daemon_exchange(request, raw, error)) {
        return make_result(action, "failed", "Daemon transport error: " + error);
    }
    json body = parse_or_null(raw);
    if (!body.is_object()) {
        return make_result(action, "failed", "Daemon returned non-JSON response: " + raw);
    }
    return ExecutionResult::from_response(action, body, raw);
}

ExecutionResult DirectShellClient::execute_subprocess(const json& action, bool dry_run) {
    if (dry_run) {
        return make_result(action, "preview", "Preview only: " + action.dump());
    }
    auto r = run_capture({opts_.binary, "exec", "--json", action.dump()},
                         (std::uint32_t)opts_.timeout_seconds * 1000u);
    if (!r.error.empty() && !r.timed_out) {
        throw std::runtime_error("DirectShell binary '" + opts_.binary +
                                 "' could not be run (" + r.error + "). Set DIRECTSHELL_BIN or install DirectShell.");
    }
    std::string output = trim(r.out.empty() ? r.err : r.out);
    if (r.timed_out) output = "DirectShell timed out: " + r.error;
    return make_result(action, r.ok ? "ok" : "failed", output);
}

json DirectShellClient::probe_http() {
    json p = {{"transport", "http"}};
    HttpReply reply;
    try {
        reply = http_request(health_url() + "?deep=1", nullptr, opts_.http_token, opts_.timeout_seconds);
    } catch (const std::exception& e) {
        p["ok"] = false;
        p["error"] = e.what();
        return p;
    }
    if (reply.code != CURLE_OK) {
        p["ok"] = false;
        p["error"] = curl_easy_strerror(reply.code);
        return p;
    }
    p["status_code"] = reply.status;
    json body = parse_or_null(reply.body);
    bool body_ok = body.is_object() && body.value("ok", false);
    p["ok"] = reply.status == 200 && body_ok;
    if (body.is_object() && body.contains("capabilities")) p["capabilities"] = body["capabilities"];
    if (reply.status != 200) p["error"] = "HTTP " + std::to_string(reply.status);
    return p;
}

json DirectShellClient::probe_daemon() {
    json request = {{"op", "probe"}, {"deep", true}};
    if (!opts_.daemon_token.empty()) request["token"] = opts_.daemon_token;
    json p = {{"transport", "daemon"}};
    std::string raw, error;
    if (!daemon_exchange(request, raw, error)) {
        p["ok"] = false;
        p["error"] = error;
        return p;
    }
    json body = parse_or_null(raw);
    if (!body.is_object()) {
        p["ok"] = false;
        p["error"] = "Daemon returned non-JSON response";
        return p;
    }
    p["ok"] = body.value("ok", false);
    if (body.contains("capabilities")) p["capabilities"] = body["capabilities"];
    if (body.contains("error")) p["error"] = body["error"];
    return p;
}

bool DirectShellClient::daemon_exchange(const json& request, std::string& response, std::string& error) {
    int fd = trim(opts_.daemon_socket).empty()
                 ? connect_tcp(opts_.daemon_host, opts_.daemon_port, &error)
                 : connect_unix(trim(opts_.daemon_socket), &error);
    if (fd < 0) {
        spdlog::warn("directshell daemon connect failed: {}", error);
        return false;
    }
    set_socket_timeout(fd, opts_.timeout_seconds);
    bool ok = write_frame(fd, request.dump());
    if (!ok) {
        error = "failed to send request";
    } else if (!read_frame(fd, response, &error)) {
        if (error.empty()) error = "connection closed";
        ok = false;
    }
    ::close(fd);
    return ok;
}

std::string DirectShellClient::health_url() const {
    std::string url = opts_.http_url;
    const std::string suffix = "/execute";
    if (url.size() >= suffix.size() && url.compare(url.size() - suffix.size(), suffix.size(), suffix) == 0) {
        return url.substr(0, url.size() - suffix.size()) + "/health";
    }
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url + "/health";
}
