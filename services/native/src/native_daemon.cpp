#include "native_daemon.hpp"
#include "frame_io.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

using json = nlohmann::json;

static json failed_response(const std::string& output) {
    return {{"status", "failed"}, {"output", output}, {"ok", false}, {"error", output}};
}

static std::runtime_error sys_error(const std::string& what) {
    return std::runtime_error(what + ": " + std::strerror(errno));
}

NativeExecutionDaemon::NativeExecutionDaemon(NativeDaemonConfig config, std::shared_ptr<ActionExecutor> executor)
    : config_(std::move(config)),
      handler_(std::move(executor), config_.token, config_.socket_path.empty() ? "tcp" : "unix") {
    if (config_.timeout_seconds < 1) config_.timeout_seconds = 1;
}

NativeExecutionDaemon::~NativeExecutionDaemon() {
    shutdown();
}

std::string NativeExecutionDaemon::endpoint() const {
    if (!config_.socket_path.empty()) return "unix:" + config_.socket_path;
    return "tcp:" + config_.host + ":" + std::to_string(bound_port_ ? bound_port_ : config_.port);
}

void NativeExecutionDaemon::listen() {
    if (listen_fd_ >= 0) return;
    if (stopping_) throw std::runtime_error("daemon has been shut down");
    if (::pipe2(wake_pipe_, O_CLOEXEC | O_NONBLOCK) != 0) throw sys_error("pipe");
    if (config_.socket_path.empty()) listen_tcp();
    else listen_unix();
    spdlog::info("[native-daemon] listening on {} (auth {})", endpoint(),
                 handler_.requires_token() ? "token" : "open");
}

void NativeExecutionDaemon::listen_unix() {
    struct sockaddr_un addr {};
    addr.sun_family = AF_UNIX;
    if (config_.socket_path.size() >= sizeof(addr.sun_path)) {
        throw std::runtime_error("unix socket path too long: " + config_.socket_path);
    }
    std::strncpy(addr.sun_path, config_.socket_path.c_str(), sizeof(addr.sun_path) - 1);

    struct stat st {};
    if (::stat(config_.socket_path.c_str(), &st) == 0) {
        if (!S_ISSOCK(st.st_mode)) {
            throw std::runtime_error("refusing to replace non-socket file: " + config_.socket_path);
        }
        ::unlink(config_.socket_path.c_str());
    }

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) throw sys_error("socket");
    if (::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
        auto err = sys_error("bind " + config_.socket_path);
        ::close(fd);
        throw err;
    }
    if (::listen(fd, 64) != 0) {
        auto err = sys_error("listen");
        ::close(fd);
        throw err;
    }
    listen_fd_ = fd;
    bound_port_ = 0;
}

void NativeExecutionDaemon::listen_tcp() {
    struct addrinfo hints {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;
    struct addrinfo* res = nullptr;
    std::string service = std::to_string(config_.port);
    int gai = ::getaddrinfo(config_.host.empty() ? nullptr : config_.host.c_str(), service.c_str(), &hints, &res);
    if (gai != 0) {
        throw std::runtime_error("resolve " + config_.host + ": " + gai_strerror(gai));
    }
    int fd = -1;
    std::string last = "no addresses";
    for (auto* ai = res; ai; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last = std::strerror(errno);
            continue;
        }
        int one = 1;
        ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
        if (::bind(fd, ai->ai_addr, ai->ai_addrlen) == 0 && ::listen(fd, 64) == 0) break;
        last = std::strerror(errno);
        ::close(fd);
        fd = -1;
    }
    ::freeaddrinfo(res);
    if (fd < 0) throw std::runtime_error("bind " + config_.host + ":" + service + ": " + last);

    struct sockaddr_storage ss {};
    socklen_t len = sizeof(ss);
    if (::getsockname(fd, reinterpret_cast<struct sockaddr*>(&ss), &len) == 0) {
        if (ss.ss_family == AF_INET) {
            bound_port_ = ntohs(reinterpret_cast<struct sockaddr_in*>(&ss)->sin_port);
        } else if (ss.ss_family == AF_INET6) {
            bound_port_ = ntohs(reinterpret_cast<struct sockaddr_in6*>(&ss)->sin6_port);
        }
    }
    listen_fd_ = fd;
}

void NativeExecutionDaemon::serve_forever() {
    if (listen_fd_ < 0) listen();
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopping_ || closed_) return;
        serving_ = true;
    }

    while (!stopping_) {
        struct pollfd fds[2];
        fds[0] = {listen_fd_, POLLIN, 0};
        fds[1] = {wake_pipe_[0], POLLIN, 0};
        int rc = ::poll(fds, 2, 1000);
        reap_finished();
        if (rc < 0) {
            if (errno == EINTR) continue;
            spdlog::error("[native-daemon] poll: {}", std::strerror(errno));
            break;
        }
        if (rc == 0 || (fds[1].revents & POLLIN)) continue;
        if (!(fds[0].revents & POLLIN)) continue;

        int client = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client < 0) {
            if (errno != EINTR && errno != EAGAIN && errno != ECONNABORTED) {
                spdlog::warn("[native-daemon] accept: {}", std::strerror(errno));
            }
            continue;
        }
        set_socket_timeout(client, config_.timeout_seconds);

        std::lock_guard<std::mutex> lk(mu_);
        if (stopping_) {
            ::close(client);
            break;
        }
        auto conn = std::make_unique<Connection>();
        conn->fd = client;
        Connection* raw = conn.get();
        connections_.push_back(std::move(conn));
        raw->thread = std::thread(&NativeExecutionDaemon::handle_connection, this, raw);
    }

    std::lock_guard<std::mutex> lk(mu_);
    serving_ = false;
    serving_cv_.notify_all();
}

void NativeExecutionDaemon::handle_connection(Connection* conn) {
    for (;;) {
        std::string body, error;
        if (!read_frame(conn->fd, body, &error)) {
            if (error == "invalid frame size") {
                write_frame(conn->fd, failed_response("request frame exceeds " +
                                                      std::to_string(kMaxFrameBytes) + " bytes").dump());
            } else if (!error.empty() && !stopping_) {
                spdlog::debug("[native-daemon] connection closed: {}", error);
            }
            break;
        }

        json response;
        json request = json::parse(body, nullptr, false);
        if (request.is_discarded()) {
            response = failed_response("invalid JSON request");
        } else {
            try {
                response = handler_.handle_request(request);
            } catch (const std::exception& e) {
                spdlog::error("[native-daemon] request failed: {}", e.what());
                response = failed_response(std::string("Native execution error: ") + e.what());
            }
        }
        if (!write_frame(conn->fd, response.dump())) break;
    }
    conn->done = true;
}

void NativeExecutionDaemon::reap_finished() {
    std::list<std::unique_ptr<Connection>> finished;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto it = connections_.begin(); it != connections_.end();) {
            if ((*it)->done) {
                finished.push_back(std::move(*it));
                it = connections_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& c : finished) {
        c->thread.join();
        ::close(c->fd);
    }
}

void NativeExecutionDaemon::close_all_connections() {
    std::list<std::unique_ptr<Connection>> all;
    {
        std::lock_guard<std::mutex> lk(mu_);
        // SHUT_RD ends idle reads but lets an in-flight response go out
        for (auto& c : connections_) ::shutdown(c->fd, SHUT_RD);
        all.swap(connections_);
    }
    for (auto& c : all) {
        c->thread.join();
        ::close(c->fd);
    }
}

void NativeExecutionDaemon::shutdown() {
    stopping_ = true;
    if (wake_pipe_[1] >= 0) {
        char b = 1;
        ssize_t n = ::write(wake_pipe_[1], &b, 1);
        (void)n;  // pipe full means a wakeup is already pending
    }
    {
        std::unique_lock<std::mutex> lk(mu_);
        serving_cv_.wait(lk, [this] { return !serving_; });
        if (closed_) return;
        closed_ = true;
    }

    close_all_connections();
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
        if (!config_.socket_path.empty()) ::unlink(config_.socket_path.c_str());
        spdlog::info("[native-daemon] stopped {}", endpoint());
    }
    for (int& fd : wake_pipe_) {
        if (fd >= 0) ::close(fd);
        fd = -1;
    }
}
