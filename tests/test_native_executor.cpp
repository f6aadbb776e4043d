#include "native_executor.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <gtest/gtest.h>

using json = nlohmann::json;

TEST(NativeDesktopExecutor, NoteEchoesTargetAndValue) {
    NativeDesktopExecutor ex("linux", 5, std::make_shared<RecordingRunner>());
    auto r = ex.execute_action({{"type", "note"}, {"value", "hello"}});
    EXPECT_EQ(r.status, "ok");
    EXPECT_EQ(r.output, "note:note hello");

    auto named = ex.execute_action({{"type", "noop"}, {"target", "checkpoint"}});
    EXPECT_EQ(named.output, "note:checkpoint");
}

TEST(NativeDesktopExecutor, WaitParsesUnitsAndClamps) {
    NativeDesktopExecutor ex("linux", 5, std::make_shared<RecordingRunner>());
    auto r = ex.execute_action({{"type", "wait"}, {"value", "0.001s"}});
    EXPECT_EQ(r.status, "ok");
    EXPECT_EQ(r.output, "waited 0.001s");

    auto clamped = ex.execute_action({{"type", "sleep"}, {"value", "10m"}}, true);
    EXPECT_EQ(clamped.status, "preview");
    EXPECT_EQ(clamped.output, "Preview only: wait 300.000s");

    auto bad = ex.execute_action({{"type", "wait"}, {"value", "soon"}});
    EXPECT_EQ(bad.status, "failed");
}

TEST(NativeDesktopExecutor, ParseDurationSeconds) {
    EXPECT_DOUBLE_EQ(*NativeDesktopExecutor::parse_duration_seconds("250ms"), 0.25);
    EXPECT_DOUBLE_EQ(*NativeDesktopExecutor::parse_duration_seconds("2m"), 120.0);
    EXPECT_DOUBLE_EQ(*NativeDesktopExecutor::parse_duration_seconds("1.5"), 1.5);
    EXPECT_DOUBLE_EQ(*NativeDesktopExecutor::parse_duration_seconds("3 seconds"), 3.0);
    EXPECT_FALSE(NativeDesktopExecutor::parse_duration_seconds("abc").has_value());
}

TEST(NativeDesktopExecutor, DurationRejectsNonNumericForms) {
    for (const char* raw : {"nan", "inf", "-1", "-5s", "0x10", "1e3"}) {
        EXPECT_FALSE(NativeDesktopExecutor::parse_duration_seconds(raw).has_value()) << raw;
    }
    EXPECT_FALSE(NativeDesktopExecutor::parse_duration_seconds(std::string(400, '9')).has_value());

    NativeDesktopExecutor ex("linux", 5, std::make_shared<RecordingRunner>());
    auto r = ex.execute_action({{"type", "wait"}, {"value", "nan"}});
    EXPECT_EQ(r.status, "failed");
    EXPECT_EQ(r.output, "invalid wait duration 'nan'");
    EXPECT_EQ(ex.execute_action({{"type", "wait"}, {"value", "-1"}}, true).status, "failed");
}

TEST(NativeDesktopExecutor, ClickRequiresCoordinates) {
    auto runner = std::make_shared<RecordingRunner>();
    NativeDesktopExecutor ex("linux", 5, runner);

    auto missing = ex.execute_action({{"type", "click"}});
    EXPECT_EQ(missing.status, "failed");
    EXPECT_NE(missing.output.find("coordinates"), std::string::npos);

    auto label = ex.execute_action({{"type", "click"}, {"target", "OK button"}});
    EXPECT_EQ(label.status, "failed");
    EXPECT_NE(label.output.find("must be coordinates, got 'OK button'"), std::string::npos);
    EXPECT_TRUE(runner->calls.empty());
}

TEST(NativeDesktopExecutor, ParseCoordinatesForms) {
    auto xy = NativeDesktopExecutor::parse_coordinates({{"x", 10}, {"y", "20"}});
    ASSERT_TRUE(xy.has_value());
    EXPECT_EQ(*xy, std::make_pair(10, 20));
    EXPECT_EQ(*NativeDesktopExecutor::parse_coordinates({{"target", "5, 6"}}), std::make_pair(5, 6));
    EXPECT_EQ(*NativeDesktopExecutor::parse_coordinates({{"target", "x=7 y=8"}}), std::make_pair(7, 8));
    EXPECT_EQ(*NativeDesktopExecutor::parse_coordinates({{"coordinates", {1, 2}}}), std::make_pair(1, 2));
    EXPECT_FALSE(NativeDesktopExecutor::parse_coordinates({{"target", "here"}}).has_value());
}

TEST(NativeDesktopExecutor, CoordinatesOutsideIntRangeAreRejected) {
    EXPECT_FALSE(NativeDesktopExecutor::parse_coordinates({{"x", 1e20}, {"y", 5}}).has_value());
    EXPECT_FALSE(NativeDesktopExecutor::parse_coordinates({{"coordinates", {5, -1e12}}}).has_value());
    EXPECT_FALSE(NativeDesktopExecutor::parse_coordinates({{"target", "99999999999, 1"}}).has_value());
    EXPECT_EQ(*NativeDesktopExecutor::parse_coordinates({{"x", 2147483647}, {"y", -2147483647}}),
              std::make_pair(2147483647, -2147483647));

    auto runner = std::make_shared<RecordingRunner>();
    NativeDesktopExecutor ex("linux", 5, runner);
    auto r = ex.execute_action({{"type", "click"}, {"x", 1e20}, {"y", 5}});
    EXPECT_EQ(r.status, "failed");
    EXPECT_NE(r.output.find("coordinates"), std::string::npos);
    EXPECT_TRUE(runner->calls.empty());
}

TEST(NativeDesktopExecutor, LinuxClickUsesXdotool) {
    auto runner = std::make_shared<RecordingRunner>();
    NativeDesktopExecutor ex("linux", 5, runner);
    auto r = ex.execute_action({{"type", "click"}, {"target", "10,20"}});
    EXPECT_EQ(r.status, "ok");
    ASSERT_EQ(runner->calls.size(), 1u);
    EXPECT_EQ(runner->calls[0], (std::vector<std::string>{"xdotool", "mousemove", "10", "20", "click", "1"}));
}

TEST(NativeDesktopExecutor, LinuxWithoutXdotoolExplainsWhy) {
    NativeDesktopExecutor ex("linux", 5, std::make_shared<RecordingRunner>(false));
    auto r = ex.execute_action({{"type", "click"}, {"x", 1}, {"y", 2}});
    EXPECT_EQ(r.status, "failed");
    EXPECT_EQ(r.output, "click on linux requires 'xdotool' in PATH");

    json probe = ex.probe();
    EXPECT_TRUE(probe["ok"].get<bool>());
    EXPECT_FALSE(probe["xdotool_available"].get<bool>());
}

TEST(NativeDesktopExecutor, LinuxTypeAndHotkey) {
    auto runner = std::make_shared<RecordingRunner>();
    NativeDesktopExecutor ex("linux", 5, runner);
    ex.execute_action({{"type", "type"}, {"value", "hi there"}});
    ex.execute_action({{"type", "hotkey"}, {"target", "ctrl+enter"}});
    ASSERT_EQ(runner->calls.size(), 2u);
    EXPECT_EQ(runner->calls[0], (std::vector<std::string>{"xdotool", "type", "--delay", "1", "--", "hi there"}));
    EXPECT_EQ(runner->calls[1], (std::vector<std::string>{"xdotool", "key", "ctrl+Return"}));
}

TEST(NativeDesktopExecutor, DarwinHotkeyUsesAppleScript) {
    auto runner = std::make_shared<RecordingRunner>();
    NativeDesktopExecutor ex("darwin", 5, runner);
    auto r = ex.execute_action({{"type", "hotkey"}, {"target", "cmd+l"}});
    EXPECT_EQ(r.status, "ok");
    ASSERT_EQ(runner->calls.size(), 1u);
    ASSERT_EQ(runner->calls[0].size(), 3u);
    EXPECT_EQ(runner->calls[0][0], "osascript");
    EXPECT_EQ(runner->calls[0][2],
              "tell application \"System Events\" to keystroke \"l\" using {command down}");
}

TEST(NativeDesktopExecutor, RunShellGoesThroughRunnerUnlessDryRun) {
    auto runner = std::make_shared<RecordingRunner>();
    runner->reply.out = "hello\n";
    NativeDesktopExecutor ex("plan9", 5, runner);

    auto preview = ex.execute_action({{"type", "run_shell"}, {"value", "echo hello"}}, true);
    EXPECT_EQ(preview.status, "preview");
    EXPECT_TRUE(runner->calls.empty());

    auto r = ex.execute_action({{"type", "run_shell"}, {"value", "echo hello"}});
    EXPECT_EQ(r.status, "ok");
    EXPECT_EQ(r.output, "hello");
    ASSERT_EQ(runner->calls.size(), 1u);
    EXPECT_EQ(runner->calls[0], (std::vector<std::string>{"/bin/sh", "-c", "echo hello"}));
}

TEST(NativeDesktopExecutor, FailedCommandReportsOutput) {
    auto runner = std::make_shared<RecordingRunner>();
    runner->reply.ok = false;
    runner->reply.exit_code = 2;
    runner->reply.err = "no display";
    NativeDesktopExecutor ex("linux", 5, runner);
    auto r = ex.execute_action({{"type", "open_url"}, {"target", "https://example.com"}});
    EXPECT_EQ(r.status, "failed");
    EXPECT_EQ(r.output, "no display");
    EXPECT_EQ(runner->calls[0], (std::vector<std::string>{"xdg-open", "https://example.com"}));
}

TEST(NativeDesktopExecutor, ValidatesActionType) {
    NativeDesktopExecutor ex("linux", 5, std::make_shared<RecordingRunner>());
    auto missing = ex.execute_action({{"target", "x"}});
    EXPECT_EQ(missing.status, "failed");
    EXPECT_EQ(missing.output, "Action missing required field: type");

    auto unknown = ex.execute_action({{"type", "teleport"}});
    EXPECT_EQ(unknown.status, "failed");
    EXPECT_NE(unknown.output.find("Supported:"), std::string::npos);
    EXPECT_NE(unknown.output.find("click"), std::string::npos);
}

TEST(NativeDesktopExecutor, ProbeByPlatform) {
    NativeDesktopExecutor plan9("plan9", 5, std::make_shared<RecordingRunner>());
    json p = plan9.probe();
    EXPECT_FALSE(p["ok"].get<bool>());
    EXPECT_EQ(p["error"], "Unsupported platform for native execution: plan9");

    NativeDesktopExecutor windows("win32", 5, std::make_shared<RecordingRunner>());
    EXPECT_TRUE(windows.probe()["ok"].get<bool>());

    auto caps = plan9.capabilities();
    EXPECT_NE(std::find(caps.begin(), caps.end(), "note"), caps.end());
    EXPECT_NE(std::find(caps.begin(), caps.end(), "run_shell"), caps.end());
}
