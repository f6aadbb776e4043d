#pragma once
#include "process.hpp"
#include <string>
#include <vector>

// How the desktop executor reaches the OS. Tests substitute a recorder.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual CaptureResult run(const std::vector<std::string>& argv, int timeout_seconds) = 0;
    virtual CaptureResult run_shell(const std::string& command, int timeout_seconds) = 0;
    virtual bool has_program(const std::string& name) = 0;
};

class PosixCommandRunner : public CommandRunner {
public:
    CaptureResult run(const std::vector<std::string>& argv, int timeout_seconds) override;
    CaptureResult run_shell(const std::string& command, int timeout_seconds) override;
    bool has_program(const std::string& name) override;
};
