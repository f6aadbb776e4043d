#pragma once
#include "command_runner.hpp"
#include "execution_types.hpp"
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Built-in desktop action executor. The platform is configuration, not
// detection: "darwin", "linux*", "win*" are supported, anything else only
// runs the platform-neutral actions (note, wait, run_shell).
class NativeDesktopExecutor : public ActionExecutor {
public:
    explicit NativeDesktopExecutor(std::string platform_name = default_platform_name(),
                                   int timeout_seconds = 30,
                                   std::shared_ptr<CommandRunner> runner = nullptr);

    ExecutionResult execute_action(const nlohmann::json& action, bool dry_run = false) override;
    nlohmann::json probe() override;
    std::vector<std::string> capabilities() const override;

    const std::string& platform_name() const { return platform_; }

    static std::string default_platform_name();
    // "1.5", "250ms", "2 min" -> seconds; nullopt if unparseable.
    static std::optional<double> parse_duration_seconds(const std::string& raw);
    // x/y fields, a "coordinates" array/object, or "x,y" / "x=.. y=.." text.
    static std::optional<std::pair<int, int>> parse_coordinates(const nlohmann::json& action);

private:
    ExecutionResult execute_note(const nlohmann::json& action, bool dry_run);
    ExecutionResult execute_wait(const nlohmann::json& action, bool dry_run);
    ExecutionResult execute_open_url(const nlohmann::json& action, bool dry_run);
    ExecutionResult execute_open_app(const nlohmann::json& action, bool dry_run);
    ExecutionResult execute_type(const nlohmann::json& action, bool dry_run);
    ExecutionResult execute_key(const nlohmann::json& action, bool dry_run);
    ExecutionResult execute_hotkey(const nlohmann::json& action, bool dry_run);
    ExecutionResult execute_click(const nlohmann::json& action, bool dry_run);
    ExecutionResult execute_run_shell(const nlohmann::json& action, bool dry_run);

    ExecutionResult from_capture(const nlohmann::json& action, const CaptureResult& r) const;
    ExecutionResult unsupported_here(const nlohmann::json& action, const std::string& what) const;

    bool is_macos() const;
    bool is_linux() const;
    bool is_windows() const;

    std::string platform_;
    int timeout_seconds_;
    std::shared_ptr<CommandRunner> runner_;
};
