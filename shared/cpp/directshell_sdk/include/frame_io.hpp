#pragma once
#include <cstddef>
#include <string>

// Socket framing for the execution daemon: 4-byte big-endian length + JSON body.
constexpr std::size_t kMaxFrameBytes = 2 * 1024 * 1024;

bool write_frame(int fd, const std::string& body);

// Returns false when the peer closed the connection (error left empty) or on
// a read error / bad length (error describes it).
bool read_frame(int fd, std::string& body, std::string* error = nullptr);

// Connected stream socket, or -1 with *error set.
int connect_unix(const std::string& path, std::string* error);
int connect_tcp(const std::string& host, int port, std::string* error);

void set_socket_timeout(int fd, int seconds);
