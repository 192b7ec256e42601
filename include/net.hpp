#pragma once
// Net module: blocking socket helpers shared by the HTTP and WebSocket layers.
#include <cstddef>
#include <cstdint>
#include <string>

namespace net {
// Write all bytes handling partial writes and EINTR.
bool send_all(int fd, const uint8_t* data, size_t len);
bool send_all(int fd, const std::string& data);

// Read exactly `n` bytes into `dst`.
// Returns:
//  1  - read all `n` bytes
//  0  - peer closed before the first byte
// -1  - error, timeout, or EOF part way through (errno set for errors)
int recv_exact(int fd, void* dst, size_t n);

// `recv_exact` == 1.
bool read_exact(int fd, void* dst, size_t n);

// Read a line terminated by "\n" (a preceding "\r" is stripped).
// Returns false on EOF/error or when the line exceeds `max_len`.
bool read_line(int fd, std::string& out, size_t max_len);

// "ip:port" of the remote end, or "unknown".
std::string peer_address(int fd);

// Bound SO_RCVTIMEO; 0 disables the timeout.
void set_read_timeout(int fd, int seconds);
} // namespace net
