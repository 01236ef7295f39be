#pragma once
// Frame codec: ProtocolMessage <-> bytes.
//
// `encode` and `decode` are pure. `decode` looks only at the front of the
// given bytes and reports how many it consumed, so a stream can be cut into
// chunks anywhere. `FrameReader` is the accumulator used by the read loop.
//
// A MALFORMED result means the stream is desynchronized; the connection
// must be dropped.
#include "protocol.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace codec {
enum class DecodeStatus { COMPLETE, INCOMPLETE, MALFORMED };

// Serialize header + payload. Throws std::length_error if a string field
// or the payload exceeds the protocol limits.
std::vector<uint8_t> encode(const ProtocolMessage& m);

// Decode the first frame in [data, data + len).
// COMPLETE: `out` is set and `consumed` holds the frame size.
// INCOMPLETE: more bytes are needed; nothing is consumed.
// MALFORMED: unknown type, corrupt length or bad payload; `error` explains.
DecodeStatus decode(const uint8_t* data, size_t len, ProtocolMessage& out, size_t& consumed, std::string& error);

// Byte accumulator for a streaming connection.
class FrameReader {
  std::vector<uint8_t> buffer;

public:
  void feed(const uint8_t* data, size_t len);
  void feed(const std::vector<uint8_t>& chunk) {
    feed(chunk.data(), chunk.size());
  }
  // Pop the next complete frame, if any.
  DecodeStatus next(ProtocolMessage& out, std::string& error);
  size_t buffered() const {
    return buffer.size();
  }
  void clear() {
    buffer.clear();
  }
};
} // namespace codec
