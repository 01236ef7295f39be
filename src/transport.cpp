#include "transport.hpp"
#include "logger.hpp"
#include "net.hpp"
#include <sys/socket.h>
#include <unistd.h>

TcpTransport::TcpTransport(int connect_timeout_ms) : connect_timeout_ms(connect_timeout_ms) {}

TcpTransport::~TcpTransport() {
  if (fd != -1)
    ::close(fd);
}

bool TcpTransport::mark_dead() {
  return !dead.exchange(true);
}

bool TcpTransport::connect(const ServerAddress& address, std::string& error) {
  if (fd != -1) {
    error = "transport already used";
    return false;
  }
  fd = net::connect_tcp(address.host, address.port, connect_timeout_ms, error);
  if (fd == -1) {
    dead = true;
    return false;
  }
  Logger::log(Logger::DEBUG, "tcp connected to " + address.to_string() + " (fd=" + std::to_string(fd) + ")");
  return true;
}

bool TcpTransport::send(const std::vector<uint8_t>& bytes, std::string& error) {
  if (fd == -1 || dead) {
    error = "connection is closed";
    return false;
  }
  if (net::send_all(fd, bytes.data(), bytes.size(), error))
    return true;
  if (mark_dead()) {
    Logger::log(Logger::WARN, "tcp write failed: " + error);
    shutdown(fd, SHUT_RDWR);
  }
  return false;
}

ReceiveStatus TcpTransport::receive(std::vector<uint8_t>& chunk, std::chrono::milliseconds timeout) {
  if (fd == -1 || dead)
    return ReceiveStatus::CLOSED;
  std::string error;
  long rc = net::recv_some(fd, chunk, static_cast<int>(timeout.count()), error);
  if (rc > 0)
    return ReceiveStatus::DATA;
  if (rc == -2)
    return dead ? ReceiveStatus::CLOSED : ReceiveStatus::TIMEOUT;
  if (rc == 0) {
    if (mark_dead())
      Logger::log(Logger::INFO, "server closed the connection");
    return ReceiveStatus::CLOSED;
  }
  if (mark_dead()) {
    Logger::log(Logger::WARN, "tcp read failed: " + error);
    return ReceiveStatus::FAILED;
  }
  return ReceiveStatus::CLOSED;
}

void TcpTransport::close() {
  // shutdown() wakes a blocked receive(); the destructor releases the descriptor.
  if (fd != -1 && mark_dead())
    shutdown(fd, SHUT_RDWR);
}
