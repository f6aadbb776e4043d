#include "native_executor.hpp"
#include "util.hpp"
#include <algorithm>
#include <chrono>
#include <climits>
#include <cmath>
#include <cstdio>
#include <map>
#include <regex>
#include <sstream>
#include <thread>

using json = nlohmann::json;

static const std::regex kDurationRe(
    R"(^\s*(\d+(?:\.\d+)?)\s*(ms|s|sec|secs|second|seconds|m|min|mins|minute|minutes)?\s*$)",
    std::regex::icase);
static const std::regex kCoordPairRe(R"(^\s*(-?\d+)\s*[,x]\s*(-?\d+)\s*$)", std::regex::icase);
static const std::regex kCoordNamedRe(R"(^\s*x\s*=\s*(-?\d+)\s*[,\s]\s*y\s*=\s*(-?\d+)\s*$)", std::regex::icase);

static const std::map<std::string, std::string> kAppleModifiers = {
    {"cmd", "command down"}, {"command", "command down"},
    {"ctrl", "control down"}, {"control", "control down"},
    {"alt", "option down"}, {"option", "option down"},
    {"shift", "shift down"},
};

static const std::map<std::string, int> kAppleKeyCodes = {
    {"enter", 36}, {"return", 36}, {"tab", 48}, {"space", 49},
    {"esc", 53}, {"escape", 53}, {"delete", 51}, {"backspace", 51},
    {"up", 126}, {"down", 125}, {"left", 123}, {"right", 124},
};

static const std::map<std::string, std::string> kXdotoolKeys = {
    {"enter", "Return"}, {"return", "Return"}, {"tab", "Tab"}, {"space", "space"},
    {"esc", "Escape"}, {"escape", "Escape"}, {"delete", "BackSpace"}, {"backspace", "BackSpace"},
    {"up", "Up"}, {"down", "Down"}, {"left", "Left"}, {"right", "Right"},
    {"cmd", "super"}, {"command", "super"}, {"ctrl", "ctrl"}, {"control", "ctrl"},
    {"alt", "alt"}, {"option", "alt"}, {"shift", "shift"},
};

// String view of a scalar field; objects, arrays and null read as "".
static std::string field(const json& action, const char* key) {
    auto it = action.find(key);
    if (it == action.end() || it->is_null()) return {};
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number() || it->is_boolean()) return it->dump();
    return {};
}

static std::string first_of(const json& action, const char* a, const char* b) {
    std::string v = field(action, a);
    return v.empty() ? field(action, b) : v;
}

static std::string escape_applescript(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (c == '\\' || c == '"') out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

static std::string apple_key_script(const std::string& key, const std::vector<std::string>& modifiers) {
    std::string base;
    if (key.size() == 1) {
        base = "keystroke \"" + escape_applescript(key) + "\"";
    } else {
        auto it = kAppleKeyCodes.find(key);
        if (it == kAppleKeyCodes.end()) throw std::invalid_argument("unsupported key '" + key + "'");
        base = "key code " + std::to_string(it->second);
    }
    std::string clause;
    for (const auto& m : modifiers) {
        auto it = kAppleModifiers.find(m);
        if (it == kAppleModifiers.end()) continue;
        if (!clause.empty()) clause += ", ";
        clause += it->second;
    }
    if (clause.empty()) return "tell application \"System Events\" to " + base;
    return "tell application \"System Events\" to " + base + " using {" + clause + "}";
}

static std::string xdotool_key(const std::string& key) {
    if (key.size() == 1) return key;
    auto it = kXdotoolKeys.find(key);
    return it == kXdotoolKeys.end() ? key : it->second;
}

static std::vector<std::string> split_chord(const std::string& chord) {
    std::vector<std::string> parts;
    std::stringstream ss(chord);
    std::string item;
    while (std::getline(ss, item, '+')) {
        item = trim(item);
        if (!item.empty()) parts.push_back(item);
    }
    return parts;
}

static std::optional<int> as_int(const json& v) {
    if (v.is_number()) {
        double d = v.get<double>();
        if (!std::isfinite(d) || d < (double)INT_MIN || d > (double)INT_MAX) return std::nullopt;
        return (int)d;
    }
    if (v.is_string()) {
        try {
            size_t used = 0;
            int n = std::stoi(v.get<std::string>(), &used);
            if (used == v.get<std::string>().size()) return n;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

static ExecutionResult preview(const json& action, const std::string& what) {
    return make_result(action, "preview", "Preview only: " + what);
}

NativeDesktopExecutor::NativeDesktopExecutor(std::string platform_name, int timeout_seconds,
                                             std::shared_ptr<CommandRunner> runner)
    : platform_(to_lower(trim(platform_name))),
      timeout_seconds_(std::max(1, timeout_seconds)),
      runner_(runner ? std::move(runner) : std::make_shared<PosixCommandRunner>()) {
    if (platform_.empty()) platform_ = default_platform_name();
}

std::string NativeDesktopExecutor::default_platform_name() {
#if defined(__APPLE__)
    return "darwin";
#elif defined(_WIN32)
    return "win32";
#elif defined(__linux__)
    return "linux";
#else
    return "unknown";
#endif
}

ExecutionResult NativeDesktopExecutor::execute_action(const json& action, bool dry_run) {
    if (!action.is_object()) {
        return make_result(json::object(), "failed", "Action must be a JSON object");
    }
    std::string type = to_lower(trim(field(action, "type")));
    if (type.empty()) {
        return make_result(action, "failed", "Action missing required field: type");
    }

    using Handler = ExecutionResult (NativeDesktopExecutor::*)(const json&, bool);
    static const std::map<std::string, Handler> handlers = {
        {"note", &NativeDesktopExecutor::execute_note},
        {"noop", &NativeDesktopExecutor::execute_note},
        {"wait", &NativeDesktopExecutor::execute_wait},
        {"sleep", &NativeDesktopExecutor::execute_wait},
        {"open_url", &NativeDesktopExecutor::execute_open_url},
        {"open_app", &NativeDesktopExecutor::execute_open_app},
        {"type", &NativeDesktopExecutor::execute_type},
        {"text", &NativeDesktopExecutor::execute_type},
        {"input", &NativeDesktopExecutor::execute_type},
        {"key", &NativeDesktopExecutor::execute_key},
        {"press", &NativeDesktopExecutor::execute_key},
        {"hotkey", &NativeDesktopExecutor::execute_hotkey},
        {"click", &NativeDesktopExecutor::execute_click},
        {"run_shell", &NativeDesktopExecutor::execute_run_shell},
        {"shell", &NativeDesktopExecutor::execute_run_shell},
        {"terminal", &NativeDesktopExecutor::execute_run_shell},
        {"command", &NativeDesktopExecutor::execute_run_shell},
    };

    auto it = handlers.find(type);
    if (it == handlers.end()) {
        std::string supported;
        for (const auto& kv : handlers) {
            if (!supported.empty()) supported += ", ";
            supported += kv.first;
        }
        return make_result(action, "failed",
                           "Unsupported native action type '" + type + "'. Supported: " + supported);
    }

    try {
        return (this->*(it->second))(action, dry_run);
    } catch (const std::exception& e) {
        return make_result(action, "failed", std::string("Native execution error: ") + e.what());
    }
}

json NativeDesktopExecutor::probe() {
    json out = {{"transport", "native"}, {"platform", platform_}, {"capabilities", capabilities()}};
    if (is_macos()) {
        auto r = runner_->run({"osascript", "-e", "return \"ok\""}, timeout_seconds_);
        out["ok"] = r.ok;
        out["output"] = trim(r.out.empty() ? r.err : r.out);
        return out;
    }
    if (is_linux()) {
        bool has_xdotool = runner_->has_program("xdotool");
        out["ok"] = true;
        out["xdotool_available"] = has_xdotool;
        out["output"] = has_xdotool
                            ? "linux native execution available"
                            : "linux native execution available (limited: install xdotool for type/key/hotkey/click)";
        return out;
    }
    if (is_windows()) {
        out["ok"] = true;
        out["output"] = "windows native execution available (open_url/open_app/run_shell/wait fully supported)";
        return out;
    }
    out["ok"] = false;
    out["error"] = "Unsupported platform for native execution: " + platform_;
    return out;
}

std::vector<std::string> NativeDesktopExecutor::capabilities() const {
    return {"note", "wait", "open_url", "open_app", "type", "key", "hotkey", "click", "run_shell"};
}

std::optional<double> NativeDesktopExecutor::parse_duration_seconds(const std::string& raw) {
    std::smatch m;
    if (!std::regex_match(raw, m, kDurationRe)) return std::nullopt;
    double value = 0;
    try {
        value = std::stod(m[1].str());
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (!std::isfinite(value)) return std::nullopt;
    std::string unit = to_lower(m[2].str());
    if (unit == "ms") return value / 1000.0;
    if (!unit.empty() && unit[0] == 'm') return value * 60.0;
    return value;
}

std::optional<std::pair<int, int>> NativeDesktopExecutor::parse_coordinates(const json& action) {
    if (action.contains("x") && action.contains("y")) {
        auto x = as_int(action["x"]);
        auto y = as_int(action["y"]);
        if (x && y) return std::make_pair(*x, *y);
    }
    if (action.contains("coordinates")) {
        const auto& c = action["coordinates"];
        if (c.is_array() && c.size() == 2) {
            auto x = as_int(c[0]);
            auto y = as_int(c[1]);
            if (x && y) return std::make_pair(*x, *y);
        }
        if (c.is_object() && c.contains("x") && c.contains("y")) {
            auto x = as_int(c["x"]);
            auto y = as_int(c["y"]);
            if (x && y) return std::make_pair(*x, *y);
        }
    }
    std::string raw = first_of(action, "target", "value");
    std::smatch m;
    if (std::regex_match(raw, m, kCoordPairRe) || std::regex_match(raw, m, kCoordNamedRe)) {
        auto x = as_int(json(m[1].str()));
        auto y = as_int(json(m[2].str()));
        if (x && y) return std::make_pair(*x, *y);
    }
    return std::nullopt;
}

ExecutionResult NativeDesktopExecutor::execute_note(const json& action, bool dry_run) {
    std::string target = trim(field(action, "target"));
    if (target.empty()) target = "note";
    std::string value = trim(field(action, "value"));
    std::string text = "note:" + target;
    if (!value.empty()) text += " " + value;
    if (dry_run) return preview(action, text);
    return make_result(action, "ok", text);
}

ExecutionResult NativeDesktopExecutor::execute_wait(const json& action, bool dry_run) {
    std::string raw = trim(first_of(action, "value", "target"));
    if (raw.empty()) raw = "1";
    auto parsed = parse_duration_seconds(raw);
    if (!parsed) {
        return make_result(action, "failed", "invalid wait duration '" + raw + "'");
    }
    double seconds = std::max(0.0, std::min(300.0, *parsed));
    char buf[64];
    if (dry_run) {
        std::snprintf(buf, sizeof(buf), "wait %.3fs", seconds);
        return preview(action, buf);
    }
    std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
    std::snprintf(buf, sizeof(buf), "waited %.3fs", seconds);
    return make_result(action, "ok", buf);
}

ExecutionResult NativeDesktopExecutor::execute_open_url(const json& action, bool dry_run) {
    std::string url = trim(first_of(action, "target", "value"));
    if (url.empty()) return make_result(action, "failed", "open_url requires target or value");
    std::vector<std::string> argv;
    if (is_macos()) argv = {"open", url};
    else if (is_linux()) argv = {"xdg-open", url};
    else if (is_windows()) argv = {"cmd", "/c", "start", "", url};
    else return make_result(action, "failed", "Unsupported platform: " + platform_);
    if (dry_run) return preview(action, "open_url " + url);
    return from_capture(action, runner_->run(argv, timeout_seconds_));
}

ExecutionResult NativeDesktopExecutor::execute_open_app(const json& action, bool dry_run) {
    std::string app = trim(first_of(action, "target", "value"));
    if (app.empty()) return make_result(action, "failed", "open_app requires target or value");
    std::vector<std::string> argv;
    if (is_macos()) argv = {"open", "-a", app};
    else if (is_linux()) argv = {"nohup", app};
    else if (is_windows()) argv = {"cmd", "/c", "start", "", app};
    else return make_result(action, "failed", "Unsupported platform: " + platform_);
    if (dry_run) return preview(action, "open_app " + app);
    return from_capture(action, runner_->run(argv, timeout_seconds_));
}

ExecutionResult NativeDesktopExecutor::execute_type(const json& action, bool dry_run) {
    std::string text = first_of(action, "value", "target");
    if (text.empty()) return make_result(action, "failed", "type action requires value or target");
    if (is_macos()) {
        if (dry_run) return preview(action, "type " + text);
        std::string script = "tell application \"System Events\" to keystroke \"" + escape_applescript(text) + "\"";
        return from_capture(action, runner_->run({"osascript", "-e", script}, timeout_seconds_));
    }
    if (is_linux()) {
        if (!runner_->has_program("xdotool")) {
            return make_result(action, "failed", "type on linux requires 'xdotool' in PATH");
        }
        if (dry_run) return preview(action, "type " + text);
        return from_capture(action, runner_->run({"xdotool", "type", "--delay", "1", "--", text}, timeout_seconds_));
    }
    return unsupported_here(action, "type");
}

ExecutionResult NativeDesktopExecutor::execute_key(const json& action, bool dry_run) {
    std::string key = to_lower(trim(first_of(action, "target", "value")));
    if (key.empty()) return make_result(action, "failed", "key action requires target or value");
    if (is_macos()) {
        std::string script = apple_key_script(key, {});
        if (dry_run) return preview(action, "key " + key);
        return from_capture(action, runner_->run({"osascript", "-e", script}, timeout_seconds_));
    }
    if (is_linux()) {
        if (!runner_->has_program("xdotool")) {
            return make_result(action, "failed", "key on linux requires 'xdotool' in PATH");
        }
        if (dry_run) return preview(action, "key " + key);
        return from_capture(action, runner_->run({"xdotool", "key", xdotool_key(key)}, timeout_seconds_));
    }
    return unsupported_here(action, "key");
}

ExecutionResult NativeDesktopExecutor::execute_hotkey(const json& action, bool dry_run) {
    std::string chord = to_lower(trim(first_of(action, "target", "value")));
    if (chord.empty()) return make_result(action, "failed", "hotkey action requires target or value");
    auto parts = split_chord(chord);
    if (parts.empty()) return make_result(action, "failed", "invalid hotkey: " + chord);
    if (is_macos()) {
        std::vector<std::string> modifiers(parts.begin(), parts.end() - 1);
        std::string script = apple_key_script(parts.back(), modifiers);
        if (dry_run) return preview(action, "hotkey " + chord);
        return from_capture(action, runner_->run({"osascript", "-e", script}, timeout_seconds_));
    }
    if (is_linux()) {
        if (!runner_->has_program("xdotool")) {
            return make_result(action, "failed", "hotkey on linux requires 'xdotool' in PATH");
        }
        std::string resolved;
        for (const auto& p : parts) {
            if (!resolved.empty()) resolved += "+";
            resolved += xdotool_key(p);
        }
        if (dry_run) return preview(action, "hotkey " + resolved);
        return from_capture(action, runner_->run({"xdotool", "key", resolved}, timeout_seconds_));
    }
    return unsupported_here(action, "hotkey");
}

ExecutionResult NativeDesktopExecutor::execute_click(const json& action, bool dry_run) {
    auto coords = parse_coordinates(action);
    if (!coords) {
        std::string raw = trim(first_of(action, "target", "value"));
        if (raw.empty()) {
            return make_result(action, "failed", "click requires coordinates: set x and y, or target 'x,y'");
        }
        return make_result(action, "failed",
                           "click target must be coordinates, got '" + raw + "'. Expected 'x,y' or 'x=.. y=..'.");
    }
    std::string x = std::to_string(coords->first);
    std::string y = std::to_string(coords->second);
    if (is_macos()) {
        if (dry_run) return preview(action, "click at " + x + "," + y);
        std::string script = "tell application \"System Events\" to click at {" + x + ", " + y + "}";
        return from_capture(action, runner_->run({"osascript", "-e", script}, timeout_seconds_));
    }
    if (is_linux()) {
        if (!runner_->has_program("xdotool")) {
            return make_result(action, "failed", "click on linux requires 'xdotool' in PATH");
        }
        if (dry_run) return preview(action, "click at " + x + "," + y);
        return from_capture(action, runner_->run({"xdotool", "mousemove", x, y, "click", "1"}, timeout_seconds_));
    }
    return unsupported_here(action, "click");
}

ExecutionResult NativeDesktopExecutor::execute_run_shell(const json& action, bool dry_run) {
    std::string command = trim(first_of(action, "value", "target"));
    if (command.empty()) return make_result(action, "failed", "run_shell action requires value or target");
    if (dry_run) return preview(action, "run_shell " + command);
    return from_capture(action, runner_->run_shell(command, timeout_seconds_));
}

ExecutionResult NativeDesktopExecutor::from_capture(const json& action, const CaptureResult& r) const {
    std::string output = trim(r.out.empty() ? r.err : r.out);
    if (!r.error.empty() && output.empty()) output = r.error;
    if (output.empty()) output = "exit=" + std::to_string(r.exit_code);
    return make_result(action, r.ok ? "ok" : "failed", output);
}

ExecutionResult NativeDesktopExecutor::unsupported_here(const json& action, const std::string& what) const {
    return make_result(action, "failed",
                       what + " is only implemented for macOS/linux native runtime (platform=" + platform_ + ")");
}

bool NativeDesktopExecutor::is_macos() const { return platform_ == "darwin"; }
bool NativeDesktopExecutor::is_linux() const { return platform_.rfind("linux", 0) == 0; }
bool NativeDesktopExecutor::is_windows() const { return platform_.rfind("win", 0) == 0; }
