#include "directshell_client.hpp"
#include "native_executor.hpp"
#include "native_http.hpp"
#include "test_support.hpp"
#include <curl/curl.h>
#include <chrono>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using json = nlohmann::json;

namespace {
struct RawReply {
    long status{0};
    std::string body;
};

size_t collect(void* data, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(data), size * nmemb);
    return size * nmemb;
}

RawReply raw_request(const std::string& url, const std::string* post_body = nullptr,
                     const std::vector<std::string>& headers = {}) {
    RawReply reply;
    CURL* h = curl_easy_init();
    if (!h) return reply;
    struct curl_slist* list = nullptr;
    for (const auto& hdr : headers) list = curl_slist_append(list, hdr.c_str());
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, list);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, collect);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &reply.body);
    curl_easy_setopt(h, CURLOPT_TIMEOUT, 5L);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    if (post_body) {
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, post_body->c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, (long)post_body->size());
    }
    if (curl_easy_perform(h) == CURLE_OK) curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &reply.status);
    curl_slist_free_all(list);
    curl_easy_cleanup(h);
    return reply;
}

std::shared_ptr<ActionExecutor> test_executor() {
    return std::make_shared<NativeDesktopExecutor>("linux", 5, std::make_shared<RecordingRunner>());
}

NativeHttpConfig local_config(const std::string& token = "") {
    NativeHttpConfig cfg;
    cfg.port = 0;
    cfg.token = token;
    return cfg;
}

std::string base_url(const NativeExecutionHTTPServer& server) {
    return "http://127.0.0.1:" + std::to_string(server.port());
}

DirectShellClient http_client(const NativeExecutionHTTPServer& server, const std::string& token = "") {
    DirectShellOptions o;
    o.transport = "http";
    o.http_url = base_url(server) + "/execute";
    o.http_token = token;
    o.timeout_seconds = 5;
    return DirectShellClient(o);
}
}  // namespace

TEST(NativeExecutionHTTPServer, ExecutesThroughClient) {
    NativeExecutionHTTPServer server(local_config(), test_executor());
    server.start();
    ASSERT_GT(server.port(), 0);

    auto client = http_client(server);
    auto r = client.execute_action({{"type", "note"}, {"value", "over http"}}, false);
    EXPECT_EQ(r.status, "ok");
    EXPECT_EQ(r.output, "note:note over http");

    json probe = client.probe();
    EXPECT_TRUE(probe["ok"].get<bool>());
    EXPECT_EQ(probe["status_code"], 200);
    server.shutdown();
}

TEST(NativeExecutionHTTPServer, TokenGuardsExecuteAndHealth) {
    NativeExecutionHTTPServer server(local_config("secret-http"), test_executor());
    server.start();

    auto anonymous = http_client(server);
    json probe = anonymous.probe();
    EXPECT_FALSE(probe["ok"].get<bool>());
    EXPECT_EQ(probe["status_code"], 401);
    auto denied = anonymous.execute_action({{"type", "note"}}, false);
    EXPECT_EQ(denied.status, "failed");
    EXPECT_EQ(denied.output.rfind("HTTP 401", 0), 0u);

    auto trusted = http_client(server, "secret-http");
    EXPECT_TRUE(trusted.probe()["ok"].get<bool>());
    EXPECT_EQ(trusted.execute_action({{"type", "note"}}, false).status, "ok");

    std::string body = json{{"action", {{"type", "note"}}}}.dump();
    RawReply bearer = raw_request(base_url(server) + "/execute", &body, {"Authorization: Bearer secret-http"});
    EXPECT_EQ(bearer.status, 200);
    server.shutdown();
}

TEST(NativeExecutionHTTPServer, DeepHealthListsCapabilities) {
    NativeExecutionHTTPServer server(local_config(), test_executor());
    server.start();

    RawReply shallow = raw_request(base_url(server) + "/health");
    EXPECT_EQ(shallow.status, 200);
    json s = json::parse(shallow.body);
    EXPECT_EQ(s["service"], "novaadapt-native-http");
    EXPECT_EQ(s["transport"], "http");
    EXPECT_FALSE(s.contains("capabilities"));

    RawReply deep = raw_request(base_url(server) + "/health?deep=1");
    json d = json::parse(deep.body);
    EXPECT_EQ(d["transport"], "http");
    ASSERT_TRUE(d["capabilities"].is_array());
    EXPECT_FALSE(d["capabilities"].empty());

    EXPECT_EQ(raw_request(base_url(server) + "/nowhere").status, 404);
    server.shutdown();
}

TEST(NativeExecutionHTTPServer, RejectsMalformedBodies) {
    NativeHttpConfig cfg = local_config();
    cfg.max_body_bytes = 64;
    NativeExecutionHTTPServer server(cfg, test_executor());
    server.start();
    const std::string url = base_url(server) + "/execute";

    std::string big = json{{"action", {{"type", "note"}, {"value", std::string(200, 'x')}}}}.dump();
    RawReply too_large = raw_request(url, &big);
    EXPECT_EQ(too_large.status, 413);
    EXPECT_EQ(json::parse(too_large.body)["output"], "payload too large");

    std::string garbage = "{not json";
    RawReply invalid = raw_request(url, &garbage);
    EXPECT_EQ(invalid.status, 400);
    EXPECT_EQ(json::parse(invalid.body)["output"], "invalid json");

    std::string no_action = R"({"dry_run":true})";
    RawReply missing = raw_request(url, &no_action);
    EXPECT_EQ(missing.status, 400);
    EXPECT_EQ(json::parse(missing.body)["output"], "payload must include object field 'action'");
    server.shutdown();
}

TEST(NativeExecutionHTTPServer, ShutdownLetsInFlightRequestFinish) {
    NativeExecutionHTTPServer server(local_config(), test_executor());
    server.start();
    auto client = http_client(server);

    ExecutionResult slow;
    std::thread caller([&] { slow = client.execute_action({{"type", "wait"}, {"value", "0.5s"}}, false); });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    server.shutdown();
    caller.join();

    EXPECT_EQ(slow.status, "ok");
    EXPECT_EQ(slow.output, "waited 0.500s");
    EXPECT_FALSE(client.probe()["ok"].get<bool>());
}
