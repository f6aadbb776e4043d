#include "command_runner.hpp"

CaptureResult PosixCommandRunner::run(const std::vector<std::string>& argv, int timeout_seconds) {
    return run_capture(argv, (std::uint32_t)(timeout_seconds > 0 ? timeout_seconds : 1) * 1000u);
}

CaptureResult PosixCommandRunner::run_shell(const std::string& command, int timeout_seconds) {
    return run({"/bin/sh", "-c", command}, timeout_seconds);
}

bool PosixCommandRunner::has_program(const std::string& name) {
    return program_on_path(name);
}
