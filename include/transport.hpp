#pragma once
// Transport: the byte-stream connection to the rendezvous server.
//
// Responsibilities:
// - Connect to a `ServerAddress`, send bytes, receive chunks, close
// - Deliver bytes in order without duplication while alive
// - Report the first read/write failure once; afterwards the instance is
//   dead (sends fail, receives return CLOSED) and must be replaced
//
// Threading: one thread may block in `receive()` while another calls
// `send()` or `close()`. `close()` wakes a blocked `receive()`.
#include "session.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

enum class ReceiveStatus { DATA, TIMEOUT, CLOSED, FAILED };

class Transport {
public:
  virtual ~Transport() = default;

  // Returns false and sets `error` if no connection could be made.
  virtual bool connect(const ServerAddress& address, std::string& error) = 0;
  // Returns false and sets `error` if the bytes could not all be written.
  virtual bool send(const std::vector<uint8_t>& bytes, std::string& error) = 0;
  // Wait up to `timeout` for the next chunk. DATA appends to `chunk`;
  // CLOSED is the clean end of the stream.
  virtual ReceiveStatus receive(std::vector<uint8_t>& chunk, std::chrono::milliseconds timeout) = 0;
  virtual void close() = 0;
};

// Reconnecting always asks the factory for a fresh instance.
using TransportFactory = std::function<std::unique_ptr<Transport>()>;

class TcpTransport : public Transport {
  int fd = -1;
  int connect_timeout_ms;
  std::atomic<bool> dead{false};

  // Returns true only for the first caller; later failures stay quiet.
  bool mark_dead();

public:
  explicit TcpTransport(int connect_timeout_ms = 5000);
  ~TcpTransport() override;
  TcpTransport(const TcpTransport&) = delete;
  TcpTransport& operator=(const TcpTransport&) = delete;

  bool connect(const ServerAddress& address, std::string& error) override;
  bool send(const std::vector<uint8_t>& bytes, std::string& error) override;
  ReceiveStatus receive(std::vector<uint8_t>& chunk, std::chrono::milliseconds timeout) override;
  void close() override;
};
