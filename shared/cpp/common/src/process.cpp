#include "process.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sstream>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

static std::uint64_t mono_ms() {
    struct timespec ts {};
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return (std::uint64_t)ts.tv_sec * 1000ull + (std::uint64_t)ts.tv_nsec / 1000000ull;
}

static void set_nonblock(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

static int exit_code_of(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return 1;
}

CaptureResult run_capture(const std::vector<std::string>& args,
                          std::uint32_t timeout_ms,
                          std::size_t max_bytes) {
    CaptureResult res;
    if (args.empty()) {
        res.error = "empty command";
        return res;
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (pipe(out_pipe) != 0 || pipe(err_pipe) != 0) {
        if (out_pipe[0] >= 0) { ::close(out_pipe[0]); ::close(out_pipe[1]); }
        if (err_pipe[0] >= 0) { ::close(err_pipe[0]); ::close(err_pipe[1]); }
        res.error = "failed to create pipes";
        return res;
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, out_pipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, err_pipe[1], STDERR_FILENO);
    posix_spawn_file_actions_addclose(&actions, out_pipe[0]);
    posix_spawn_file_actions_addclose(&actions, err_pipe[0]);
    posix_spawn_file_actions_addclose(&actions, out_pipe[1]);
    posix_spawn_file_actions_addclose(&actions, err_pipe[1]);

    pid_t pid = 0;
    int spawn_res = posix_spawnp(&pid, argv[0], &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);

    ::close(out_pipe[1]);
    ::close(err_pipe[1]);

    if (spawn_res != 0) {
        ::close(out_pipe[0]);
        ::close(err_pipe[0]);
        res.error = std::string("failed to spawn ") + args[0] + ": " + std::strerror(spawn_res);
        return res;
    }

    set_nonblock(out_pipe[0]);
    set_nonblock(err_pipe[0]);

    std::uint64_t start = mono_ms();
    bool out_open = true;
    bool err_open = true;
    bool exited = false;

    auto drain = [&](int fd, std::string* dst, bool* open_flag) {
        if (!*open_flag) return;
        char buf[4096];
        while (true) {
            ssize_t n = ::read(fd, buf, sizeof(buf));
            if (n > 0) {
                if (dst->size() < max_bytes) {
                    dst->append(buf, std::min(max_bytes - dst->size(), (std::size_t)n));
                }
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
            *open_flag = false;
            ::close(fd);
            return;
        }
    };

    while (out_open || err_open) {
        struct pollfd fds[2];
        nfds_t nfds = 0;
        if (out_open) { fds[nfds].fd = out_pipe[0]; fds[nfds].events = POLLIN; ++nfds; }
        if (err_open) { fds[nfds].fd = err_pipe[0]; fds[nfds].events = POLLIN; ++nfds; }

        int poll_timeout = 50;
        if (timeout_ms != 0) {
            std::uint64_t elapsed = mono_ms() - start;
            if (elapsed >= timeout_ms) {
                res.timed_out = true;
                break;
            }
            poll_timeout = (int)std::min<std::uint64_t>(timeout_ms - elapsed, 50);
        }
        (void)poll(fds, nfds, poll_timeout);

        drain(out_pipe[0], &res.out, &out_open);
        drain(err_pipe[0], &res.err, &err_open);

        if (!exited) {
            int status = 0;
            if (waitpid(pid, &status, WNOHANG) == pid) {
                exited = true;
                res.exit_code = exit_code_of(status);
            }
        }
    }

    if (res.timed_out) {
        if (out_open) ::close(out_pipe[0]);
        if (err_open) ::close(err_pipe[0]);
        if (!exited) {
            (void)kill(pid, SIGKILL);
            int status = 0;
            (void)waitpid(pid, &status, 0);
        }
        res.exit_code = 124;
        res.error = "timed out after " + std::to_string(timeout_ms) + "ms";
    } else if (!exited) {
        int status = 0;
        if (waitpid(pid, &status, 0) < 0) {
            res.error = "waitpid failed";
            return res;
        }
        res.exit_code = exit_code_of(status);
    }

    res.ok = res.exit_code == 0 && !res.timed_out;
    return res;
}

bool program_on_path(const std::string& name) {
    if (name.empty()) return false;
    if (name.find('/') != std::string::npos) return ::access(name.c_str(), X_OK) == 0;
    const char* path = std::getenv("PATH");
    if (!path) return false;
    std::stringstream ss(path);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + name;
        struct stat st {};
        if (::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}
