#include "frame_codec.hpp"
#include <stdexcept>

namespace codec {
namespace {

// Appends big-endian fields to a payload buffer.
class Writer {
  std::vector<uint8_t>& out;

public:
  explicit Writer(std::vector<uint8_t>& buffer) : out(buffer) {}

  void u16(uint16_t v) {
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v));
  }
  void u32(uint32_t v) {
    for (int shift = 24; shift >= 0; shift -= 8)
      out.push_back(static_cast<uint8_t>(v >> shift));
  }
  void u64(uint64_t v) {
    for (int shift = 56; shift >= 0; shift -= 8)
      out.push_back(static_cast<uint8_t>(v >> shift));
  }
  void str(const std::string& s) {
    if (s.size() > UINT16_MAX)
      throw std::length_error("string field too long: " + std::to_string(s.size()));
    u16(static_cast<uint16_t>(s.size()));
    out.insert(out.end(), s.begin(), s.end());
  }
};

// Reads big-endian fields from one payload. Any short read marks the
// payload as bad; callers check `ok()` once at the end.
class Reader {
  const uint8_t* data;
  size_t len;
  size_t pos = 0;
  bool good = true;

  bool need(size_t n) {
    if (!good || len - pos < n) {
      good = false;
      return false;
    }
    return true;
  }

public:
  Reader(const uint8_t* d, size_t n) : data(d), len(n) {}

  uint16_t u16() {
    if (!need(2))
      return 0;
    uint16_t v = static_cast<uint16_t>((data[pos] << 8) | data[pos + 1]);
    pos += 2;
    return v;
  }
  uint32_t u32() {
    if (!need(4))
      return 0;
    uint32_t v = 0;
    for (int i = 0; i < 4; ++i)
      v = (v << 8) | data[pos + i];
    pos += 4;
    return v;
  }
  uint64_t u64() {
    if (!need(8))
      return 0;
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i)
      v = (v << 8) | data[pos + i];
    pos += 8;
    return v;
  }
  std::string str() {
    uint16_t n = u16();
    if (!need(n))
      return {};
    std::string s(reinterpret_cast<const char*>(data + pos), n);
    pos += n;
    return s;
  }
  // True if every read succeeded and the payload was consumed exactly.
  bool ok() const {
    return good && pos == len;
  }
};

void write_payload(Writer& w, const Hello& m) {
  w.u16(m.version);
  w.str(m.tag);
}
void write_payload(Writer& w, const HelloAck& m) {
  w.u16(m.version);
}
void write_payload(Writer& w, const CreateConferenceRequest& m) {
  w.str(m.password);
}
void write_payload(Writer& w, const CreateConferenceResponse& m) {
  w.u64(m.conference_id);
}
void write_payload(Writer& w, const JoinSaltRequest& m) {
  w.u64(m.conference_id);
}
void write_payload(Writer& w, const JoinSaltResponse& m) {
  w.u64(m.conference_id);
  w.str(m.salt);
}
void write_payload(Writer& w, const JoinConferenceRequest& m) {
  w.u64(m.conference_id);
  w.str(m.password);
}
void write_payload(Writer& w, const JoinConferenceResponse& m) {
  w.str(m.pseudonym);
  w.u32(m.participants);
}
void write_payload(Writer&, const LeaveConferenceNotice&) {}
void write_payload(Writer& w, const ParticipantCount& m) {
  w.u32(m.count);
}
void write_payload(Writer& w, const ChatMessage& m) {
  w.str(m.sender);
  w.u64(m.sequence);
  w.str(m.payload);
}
void write_payload(Writer&, const Heartbeat&) {}
void write_payload(Writer&, const Disconnect&) {}
void write_payload(Writer& w, const ErrorResponse& m) {
  w.u16(static_cast<uint16_t>(m.code));
  w.str(m.reason);
}

// Build the typed frame for `type` from `r`. Only called with known types.
ProtocolMessage read_payload(MessageType type, Reader& r) {
  switch (type) {
    case MessageType::HELLO: {
      Hello m;
      m.version = r.u16();
      m.tag = r.str();
      return m;
    }
    case MessageType::HELLO_ACK: {
      HelloAck m;
      m.version = r.u16();
      return m;
    }
    case MessageType::CREATE_REQUEST: {
      CreateConferenceRequest m;
      m.password = r.str();
      return m;
    }
    case MessageType::CREATE_RESPONSE: {
      CreateConferenceResponse m;
      m.conference_id = r.u64();
      return m;
    }
    case MessageType::JOIN_SALT_REQUEST: {
      JoinSaltRequest m;
      m.conference_id = r.u64();
      return m;
    }
    case MessageType::JOIN_SALT_RESPONSE: {
      JoinSaltResponse m;
      m.conference_id = r.u64();
      m.salt = r.str();
      return m;
    }
    case MessageType::JOIN_REQUEST: {
      JoinConferenceRequest m;
      m.conference_id = r.u64();
      m.password = r.str();
      return m;
    }
    case MessageType::JOIN_RESPONSE: {
      JoinConferenceResponse m;
      m.pseudonym = r.str();
      m.participants = r.u32();
      return m;
    }
    case MessageType::LEAVE_NOTICE:
      return LeaveConferenceNotice{};
    case MessageType::PARTICIPANT_COUNT: {
      ParticipantCount m;
      m.count = r.u32();
      return m;
    }
    case MessageType::CHAT: {
      ChatMessage m;
      m.sender = r.str();
      m.sequence = r.u64();
      m.payload = r.str();
      return m;
    }
    case MessageType::HEARTBEAT:
      return Heartbeat{};
    case MessageType::DISCONNECT:
      return Disconnect{};
    case MessageType::ERROR: {
      ErrorResponse m;
      m.code = static_cast<ErrorCode>(r.u16());
      m.reason = r.str();
      return m;
    }
  }
  return Heartbeat{};
}

Header read_header(const uint8_t* p) {
  Header h;
  h.length = (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) | (static_cast<uint32_t>(p[2]) << 8) | p[3];
  h.type = static_cast<uint16_t>((p[4] << 8) | p[5]);
  h.reserved = static_cast<uint16_t>((p[6] << 8) | p[7]);
  return h;
}

} // namespace

std::vector<uint8_t> encode(const ProtocolMessage& m) {
  std::vector<uint8_t> frame(HEADER_SIZE, 0);
  Writer w(frame);
  std::visit([&w](const auto& msg) { write_payload(w, msg); }, m);

  size_t payload_len = frame.size() - HEADER_SIZE;
  if (payload_len > MAX_PAYLOAD_SIZE)
    throw std::length_error("payload too large: " + std::to_string(payload_len));

  uint16_t type = static_cast<uint16_t>(message_type(m));
  frame[0] = static_cast<uint8_t>(payload_len >> 24);
  frame[1] = static_cast<uint8_t>(payload_len >> 16);
  frame[2] = static_cast<uint8_t>(payload_len >> 8);
  frame[3] = static_cast<uint8_t>(payload_len);
  frame[4] = static_cast<uint8_t>(type >> 8);
  frame[5] = static_cast<uint8_t>(type);
  return frame;
}

DecodeStatus decode(const uint8_t* data, size_t len, ProtocolMessage& out, size_t& consumed, std::string& error) {
  consumed = 0;
  if (len < HEADER_SIZE)
    return DecodeStatus::INCOMPLETE;

  Header h = read_header(data);
  if (!is_known_type(h.type)) {
    error = "unknown frame type " + std::to_string(h.type);
    return DecodeStatus::MALFORMED;
  }
  if (h.length > MAX_PAYLOAD_SIZE) {
    error = "corrupt length field " + std::to_string(h.length);
    return DecodeStatus::MALFORMED;
  }
  if (len - HEADER_SIZE < h.length)
    return DecodeStatus::INCOMPLETE;

  MessageType type = static_cast<MessageType>(h.type);
  Reader r(data + HEADER_SIZE, h.length);
  ProtocolMessage m = read_payload(type, r);
  if (!r.ok()) {
    error = std::string("bad payload for ") + message_name(type) + " (len=" + std::to_string(h.length) + ")";
    return DecodeStatus::MALFORMED;
  }
  out = std::move(m);
  consumed = HEADER_SIZE + h.length;
  return DecodeStatus::COMPLETE;
}

void FrameReader::feed(const uint8_t* data, size_t len) {
  buffer.insert(buffer.end(), data, data + len);
}

DecodeStatus FrameReader::next(ProtocolMessage& out, std::string& error) {
  size_t consumed = 0;
  DecodeStatus status = decode(buffer.data(), buffer.size(), out, consumed, error);
  if (status == DecodeStatus::COMPLETE)
    buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(consumed));
  return status;
}
} // namespace codec
