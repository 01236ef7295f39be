#include "net.hpp"
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace net {
bool send_all(int fd, const uint8_t* data, size_t len, std::string& error) {
  size_t sent = 0;
  while (sent < len) {
    ssize_t rc = send(fd, data + sent, len - sent, MSG_NOSIGNAL);
    if (rc > 0) {
      sent += static_cast<size_t>(rc);
      continue;
    }
    if (rc == 0) {
      error = "peer closed";
      return false;
    }
    if (errno == EINTR)
      continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      error = "send timed out";
      return false;
    }
    error = std::string("send: ") + std::strerror(errno);
    return false;
  }
  return true;
}

int connect_tcp(const std::string& host, uint16_t port, int timeout_ms, std::string& error) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* results = nullptr;
  std::string service = std::to_string(port);
  int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &results);
  if (rc != 0) {
    error = "resolve " + host + ": " + gai_strerror(rc);
    return -1;
  }

  int fd = -1;
  error = "no usable address for " + host;
  for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
    fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      error = std::string("socket: ") + std::strerror(errno);
      continue;
    }
    // Linux applies SO_SNDTIMEO to connect() as well.
    timeval tv{};
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      int nodelay = 1;
      setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));
      break;
    }
    error = std::string("connect: ") + std::strerror(errno);
    close(fd);
    fd = -1;
  }
  freeaddrinfo(results);
  return fd;
}

long recv_some(int fd, std::vector<uint8_t>& out, int timeout_ms, std::string& error) {
  pollfd p{fd, POLLIN, 0};
  int ready = poll(&p, 1, timeout_ms);
  if (ready == 0)
    return -2;
  if (ready < 0) {
    if (errno == EINTR)
      return -2;
    error = std::string("poll: ") + std::strerror(errno);
    return -1;
  }

  uint8_t tmp[4096];
  ssize_t rc = recv(fd, tmp, sizeof(tmp), 0);
  if (rc > 0) {
    out.insert(out.end(), tmp, tmp + rc);
    return static_cast<long>(rc);
  }
  if (rc == 0)
    return 0; // peer closed
  if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
    return -2;
  error = std::string("recv: ") + std::strerror(errno);
  return -1;
}
} // namespace net
