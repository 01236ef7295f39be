#pragma once
// Net module: blocking TCP socket helpers used by `TcpTransport`.
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace net {
// Write all bytes handling partial writes and EINTR.
// Returns false (and sets `error`) on any failure, including a send timeout.
bool send_all(int fd, const uint8_t* data, size_t len, std::string& error);

// Resolve `host` and connect a blocking TCP socket to the first address that
// accepts. `timeout_ms` bounds each connect and later sends (SO_SNDTIMEO).
// Returns the socket, or -1 with `error` set.
int connect_tcp(const std::string& host, uint16_t port, int timeout_ms, std::string& error);

// Wait up to `timeout_ms` for data and append what is available to `out`.
// Returns:
//  >0 - number of bytes appended
//   0 - peer closed the connection
//  -1 - fatal error (`error` set)
//  -2 - nothing arrived before the timeout
long recv_some(int fd, std::vector<uint8_t>& out, int timeout_ms, std::string& error);
} // namespace net
