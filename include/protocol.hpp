// Conference protocol structures
//
// Overview:
// - Defines the wire format exchanged between the client and the rendezvous server
// - Header is 8 bytes on the wire: payload length, type, reserved (big-endian)
// - Every frame type is a plain struct; `ProtocolMessage` is the sum of them
// - Encoding/decoding lives in `frame_codec.hpp`
#ifndef PROTOCOL_HPP
#define PROTOCOL_HPP
#include <cstdint>
#include <type_traits>
#include <string>
#include <variant>

// Upper bound for payload size in bytes.
// A larger length field means the stream is corrupt.
#define MAX_PAYLOAD_SIZE 4096

// Upper bound for the text of one chat message.
#define MAX_CHAT_TEXT 2048

// Longest pseudonym accepted from the server.
#define MAX_PSEUDONYM_SIZE 64

#define PROTOCOL_VERSION 1

// Sent in `Hello` so the server can reject foreign clients early.
static constexpr char PROTOCOL_TAG[] = "\x1C"
                                       "AnonymousConference protocol";

using ConferenceId = uint64_t;
using Pseudonym = std::string;

// Explicit message type ids used on the wire.
enum class MessageType : uint16_t {
  HELLO = 0x01,
  HELLO_ACK = 0x02,
  CREATE_REQUEST = 0x10,
  CREATE_RESPONSE = 0x11,
  JOIN_SALT_REQUEST = 0x12,
  JOIN_SALT_RESPONSE = 0x13,
  JOIN_REQUEST = 0x14,
  JOIN_RESPONSE = 0x15,
  LEAVE_NOTICE = 0x16,
  PARTICIPANT_COUNT = 0x17,
  CHAT = 0x20,
  HEARTBEAT = 0x30,
  DISCONNECT = 0x31,
  ERROR = 0x7F,
};

// Error codes carried by `ErrorResponse`.
enum class ErrorCode : uint16_t { GENERAL = 0, WRONG_PASSWORD = 1, CONFERENCE_NOT_FOUND = 2 };

// Header layout (host representation; see frame_codec for byte order).
// Fields:
// - `length`: payload size in bytes
// - `type`: value from `MessageType`
// - `reserved`: always zero
struct Header {
  uint32_t length;
  uint16_t type;
  uint16_t reserved;
};
static constexpr size_t HEADER_SIZE = 8;

struct Hello {
  static constexpr MessageType TYPE = MessageType::HELLO;
  uint16_t version = PROTOCOL_VERSION;
  std::string tag = PROTOCOL_TAG;
};

struct HelloAck {
  static constexpr MessageType TYPE = MessageType::HELLO_ACK;
  uint16_t version = PROTOCOL_VERSION;
};

// `password` carries the salted credential, never the plaintext.
struct CreateConferenceRequest {
  static constexpr MessageType TYPE = MessageType::CREATE_REQUEST;
  std::string password;
};

struct CreateConferenceResponse {
  static constexpr MessageType TYPE = MessageType::CREATE_RESPONSE;
  ConferenceId conference_id = 0;
};

struct JoinSaltRequest {
  static constexpr MessageType TYPE = MessageType::JOIN_SALT_REQUEST;
  ConferenceId conference_id = 0;
};

struct JoinSaltResponse {
  static constexpr MessageType TYPE = MessageType::JOIN_SALT_RESPONSE;
  ConferenceId conference_id = 0;
  std::string salt;
};

struct JoinConferenceRequest {
  static constexpr MessageType TYPE = MessageType::JOIN_REQUEST;
  ConferenceId conference_id = 0;
  std::string password;
};

struct JoinConferenceResponse {
  static constexpr MessageType TYPE = MessageType::JOIN_RESPONSE;
  Pseudonym pseudonym;
  uint32_t participants = 0;
};

struct LeaveConferenceNotice {
  static constexpr MessageType TYPE = MessageType::LEAVE_NOTICE;
};

struct ParticipantCount {
  static constexpr MessageType TYPE = MessageType::PARTICIPANT_COUNT;
  uint32_t count = 0;
};

struct ChatMessage {
  static constexpr MessageType TYPE = MessageType::CHAT;
  Pseudonym sender;
  uint64_t sequence = 0;
  std::string payload;
};

struct Heartbeat {
  static constexpr MessageType TYPE = MessageType::HEARTBEAT;
};

struct Disconnect {
  static constexpr MessageType TYPE = MessageType::DISCONNECT;
};

struct ErrorResponse {
  static constexpr MessageType TYPE = MessageType::ERROR;
  ErrorCode code = ErrorCode::GENERAL;
  std::string reason;
};

using ProtocolMessage = std::variant<Hello, HelloAck, CreateConferenceRequest, CreateConferenceResponse, JoinSaltRequest, JoinSaltResponse, JoinConferenceRequest,
                                     JoinConferenceResponse, LeaveConferenceNotice, ParticipantCount, ChatMessage, Heartbeat, Disconnect, ErrorResponse>;

bool operator==(const Hello& a, const Hello& b);
bool operator==(const HelloAck& a, const HelloAck& b);
bool operator==(const CreateConferenceRequest& a, const CreateConferenceRequest& b);
bool operator==(const CreateConferenceResponse& a, const CreateConferenceResponse& b);
bool operator==(const JoinSaltRequest& a, const JoinSaltRequest& b);
bool operator==(const JoinSaltResponse& a, const JoinSaltResponse& b);
bool operator==(const JoinConferenceRequest& a, const JoinConferenceRequest& b);
bool operator==(const JoinConferenceResponse& a, const JoinConferenceResponse& b);
bool operator==(const LeaveConferenceNotice& a, const LeaveConferenceNotice& b);
bool operator==(const ParticipantCount& a, const ParticipantCount& b);
bool operator==(const ChatMessage& a, const ChatMessage& b);
bool operator==(const Heartbeat& a, const Heartbeat& b);
bool operator==(const Disconnect& a, const Disconnect& b);
bool operator==(const ErrorResponse& a, const ErrorResponse& b);

// Wire type of the alternative held by `m`.
MessageType message_type(const ProtocolMessage& m);

// Short printable name, for logs.
const char* message_name(MessageType type);

// True if `type` is one of the values above.
bool is_known_type(uint16_t type);

// Validate header fields against basic constraints (payload size, type bounds)
inline bool validate_header(const Header& h) {
  return h.length <= MAX_PAYLOAD_SIZE && is_known_type(h.type);
}
#endif
