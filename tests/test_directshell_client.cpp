#include "directshell_client.hpp"
#include "native_executor.hpp"
#include "test_support.hpp"
#include <cstdlib>
#include <gtest/gtest.h>
#include <stdexcept>

using json = nlohmann::json;

namespace {
DirectShellOptions with_transport(const std::string& transport) {
    DirectShellOptions o;
    o.transport = transport;
    o.timeout_seconds = 2;
    return o;
}

std::shared_ptr<ActionExecutor> recording_executor() {
    return std::make_shared<NativeDesktopExecutor>("linux", 5, std::make_shared<RecordingRunner>());
}
}  // namespace

TEST(DirectShellClient, RejectsUnknownTransport) {
    EXPECT_THROW(DirectShellClient(with_transport("carrier-pigeon")), std::invalid_argument);
    EXPECT_THROW(DirectShellClient(with_transport("native")), std::invalid_argument);
    EXPECT_NO_THROW(DirectShellClient(with_transport(" HTTP ")));
}

TEST(DirectShellClient, NativeTransportRunsInProcess) {
    DirectShellClient client(with_transport("native"), recording_executor());

    auto r = client.execute_action({{"type", "note"}, {"target", "inline"}}, false);
    EXPECT_EQ(r.status, "ok");
    EXPECT_EQ(r.output, "note:inline");
    EXPECT_EQ(r.action["target"], "inline");

    auto preview = client.execute_action({{"type", "click"}, {"x", 3}, {"y", 4}});
    EXPECT_EQ(preview.status, "preview");

    json probe = client.probe();
    EXPECT_EQ(probe["transport"], "native");
    EXPECT_EQ(probe["platform"], "linux");
}

TEST(DirectShellClient, RunPlanExecutesEachAction) {
    DirectShellClient client(with_transport("native"), recording_executor());
    json plan = json::array({{{"type", "note"}, {"target", "a"}}, {{"type", "note"}, {"target", "b"}}});
    auto results = client.run_plan(plan, false);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].output, "note:a");
    EXPECT_EQ(results[1].output, "note:b");

    EXPECT_THROW(client.run_plan(json::object(), false), std::invalid_argument);
    EXPECT_THROW(client.execute_action(json::array(), false), std::invalid_argument);
}

TEST(DirectShellClient, DaemonTransportReportsConnectFailure) {
    TempDir dir;
    DirectShellOptions o = with_transport("daemon");
    o.daemon_socket = dir.file("absent.sock");
    DirectShellClient client(o);

    auto r = client.execute_action({{"type", "note"}}, false);
    EXPECT_EQ(r.status, "failed");
    EXPECT_EQ(r.output.rfind("Daemon transport error: ", 0), 0u);

    json probe = client.probe();
    EXPECT_FALSE(probe["ok"].get<bool>());
    EXPECT_EQ(probe["transport"], "daemon");
}

TEST(DirectShellClient, SubprocessDryRunDoesNotSpawn) {
    DirectShellOptions o = with_transport("subprocess");
    o.binary = "/nonexistent/directshell";
    DirectShellClient client(o);
    json action = {{"type", "note"}};
    auto r = client.execute_action(action, true);
    EXPECT_EQ(r.status, "preview");
    EXPECT_EQ(r.output, "Preview only: " + action.dump());
}

TEST(DirectShellClient, OptionsFromEnvironment) {
    setenv("DIRECTSHELL_TRANSPORT", " Daemon ", 1);
    setenv("DIRECTSHELL_DAEMON_SOCKET", "", 1);
    setenv("DIRECTSHELL_DAEMON_PORT", "9100", 1);
    setenv("DIRECTSHELL_DAEMON_TOKEN", "  tok  ", 1);
    DirectShellOptions o = DirectShellOptions::from_env();
    unsetenv("DIRECTSHELL_TRANSPORT");
    unsetenv("DIRECTSHELL_DAEMON_SOCKET");
    unsetenv("DIRECTSHELL_DAEMON_PORT");
    unsetenv("DIRECTSHELL_DAEMON_TOKEN");

    EXPECT_EQ(o.transport, "daemon");
    EXPECT_EQ(o.daemon_port, 9100);
    EXPECT_EQ(o.daemon_token, "tok");
    EXPECT_EQ(o.http_url, "http://127.0.0.1:8765/execute");
}
