#pragma once
#include "command_runner.hpp"
#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

// mkdtemp directory removed with its contents on destruction.
class TempDir {
public:
    TempDir() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "novaadapt-test-XXXXXX").string();
        if (!mkdtemp(&tmpl[0])) throw std::runtime_error("mkdtemp failed");
        path_ = tmpl;
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

// CommandRunner that records invocations instead of spawning anything.
class RecordingRunner : public CommandRunner {
public:
    explicit RecordingRunner(bool has_programs = true) : has_programs_(has_programs) {}

    CaptureResult run(const std::vector<std::string>& argv, int /*timeout_seconds*/) override {
        std::lock_guard<std::mutex> lk(mu_);
        calls.push_back(argv);
        return reply;
    }
    CaptureResult run_shell(const std::string& command, int timeout_seconds) override {
        return run({"/bin/sh", "-c", command}, timeout_seconds);
    }
    bool has_program(const std::string& /*name*/) override { return has_programs_; }

    std::vector<std::vector<std::string>> calls;
    CaptureResult reply = ok_reply();

private:
    static CaptureResult ok_reply() {
        CaptureResult r;
        r.exit_code = 0;
        r.ok = true;
        return r;
    }

    bool has_programs_;
    std::mutex mu_;
};
