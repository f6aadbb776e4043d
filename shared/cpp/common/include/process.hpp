#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct CaptureResult {
    int exit_code{1};
    bool ok{false};         // exited with code 0
    bool timed_out{false};  // killed after timeout_ms
    std::string out;
    std::string err;
    std::string error;      // spawn/pipe/wait failure detail
};

// Spawn args[0] from PATH, capture stdout/stderr (each capped at max_bytes).
// timeout_ms == 0 waits forever.
CaptureResult run_capture(const std::vector<std::string>& args,
                          std::uint32_t timeout_ms,
                          std::size_t max_bytes = 1 << 20);

// True if `name` resolves to an executable file on PATH.
bool program_on_path(const std::string& name);
