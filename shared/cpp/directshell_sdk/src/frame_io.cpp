#include "frame_io.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

// 0 on success, 1 on clean EOF before any byte, -1 on error / short read.
static int read_exact(int fd, char* buf, std::size_t len) {
    std::size_t total = 0;
    while (total < len) {
        ssize_t n = ::recv(fd, buf + total, len - total, 0);
        if (n < 0 && errno == EINTR) continue;
        if (n == 0 && total == 0) return 1;
        if (n <= 0) return -1;
        total += static_cast<std::size_t>(n);
    }
    return 0;
}

static bool write_exact(int fd, const char* buf, std::size_t len) {
    std::size_t total = 0;
    while (total < len) {
        ssize_t n = ::send(fd, buf + total, len - total, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        total += static_cast<std::size_t>(n);
    }
    return true;
}

bool write_frame(int fd, const std::string& body) {
    if (body.size() > kMaxFrameBytes) return false;
    std::uint32_t len = htonl(static_cast<std::uint32_t>(body.size()));
    char hdr[4];
    std::memcpy(hdr, &len, sizeof(hdr));
    return write_exact(fd, hdr, sizeof(hdr)) && write_exact(fd, body.data(), body.size());
}

bool read_frame(int fd, std::string& body, std::string* error) {
    char hdr[4];
    int rc = read_exact(fd, hdr, sizeof(hdr));
    if (rc == 1) return false;
    if (rc < 0) {
        if (error) *error = errno == EAGAIN || errno == EWOULDBLOCK ? "timed out" : "truncated frame header";
        return false;
    }
    std::uint32_t len = 0;
    std::memcpy(&len, hdr, sizeof(len));
    len = ntohl(len);
    if (len == 0 || len > kMaxFrameBytes) {
        if (error) *error = "invalid frame size";
        return false;
    }
    body.assign(len, '\0');
    if (read_exact(fd, &body[0], len) != 0) {
        if (error) *error = "truncated frame";
        return false;
    }
    return true;
}

int connect_unix(const std::string& path, std::string* error) {
    struct sockaddr_un addr {};
    addr.sun_family = AF_UNIX;
    if (path.empty() || path.size() >= sizeof(addr.sun_path)) {
        if (error) *error = "invalid unix socket path: " + path;
        return -1;
    }
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        if (error) *error = std::string("socket: ") + std::strerror(errno);
        return -1;
    }
    if (::connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        if (error) *error = "connect " + path + ": " + std::strerror(errno);
        ::close(fd);
        return -1;
    }
    return fd;
}

int connect_tcp(const std::string& host, int port, std::string* error) {
    struct addrinfo hints {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    int gai = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (gai != 0) {
        if (error) *error = "resolve " + host + ": " + gai_strerror(gai);
        return -1;
    }
    int fd = -1;
    std::string last = "no addresses";
    for (auto* ai = res; ai; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last = std::strerror(errno);
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) break;
        last = std::strerror(errno);
        ::close(fd);
        fd = -1;
    }
    ::freeaddrinfo(res);
    if (fd < 0 && error) *error = "connect " + host + ":" + service + ": " + last;
    return fd;
}

void set_socket_timeout(int fd, int seconds) {
    struct timeval tv {};
    tv.tv_sec = seconds > 0 ? seconds : 1;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}
