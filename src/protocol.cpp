#include "protocol.hpp"

bool operator==(const Hello& a, const Hello& b) {
  return a.version == b.version && a.tag == b.tag;
}

bool operator==(const HelloAck& a, const HelloAck& b) {
  return a.version == b.version;
}

bool operator==(const CreateConferenceRequest& a, const CreateConferenceRequest& b) {
  return a.password == b.password;
}

bool operator==(const CreateConferenceResponse& a, const CreateConferenceResponse& b) {
  return a.conference_id == b.conference_id;
}

bool operator==(const JoinSaltRequest& a, const JoinSaltRequest& b) {
  return a.conference_id == b.conference_id;
}

bool operator==(const JoinSaltResponse& a, const JoinSaltResponse& b) {
  return a.conference_id == b.conference_id && a.salt == b.salt;
}

bool operator==(const JoinConferenceRequest& a, const JoinConferenceRequest& b) {
  return a.conference_id == b.conference_id && a.password == b.password;
}

bool operator==(const JoinConferenceResponse& a, const JoinConferenceResponse& b) {
  return a.pseudonym == b.pseudonym && a.participants == b.participants;
}

bool operator==(const LeaveConferenceNotice&, const LeaveConferenceNotice&) {
  return true;
}

bool operator==(const ParticipantCount& a, const ParticipantCount& b) {
  return a.count == b.count;
}

bool operator==(const ChatMessage& a, const ChatMessage& b) {
  return a.sender == b.sender && a.sequence == b.sequence && a.payload == b.payload;
}

bool operator==(const Heartbeat&, const Heartbeat&) {
  return true;
}

bool operator==(const Disconnect&, const Disconnect&) {
  return true;
}

bool operator==(const ErrorResponse& a, const ErrorResponse& b) {
  return a.code == b.code && a.reason == b.reason;
}

MessageType message_type(const ProtocolMessage& m) {
  return std::visit([](const auto& frame) { return std::decay_t<decltype(frame)>::TYPE; }, m);
}

const char* message_name(MessageType type) {
  switch (type) {
    case MessageType::HELLO:
      return "Hello";
    case MessageType::HELLO_ACK:
      return "HelloAck";
    case MessageType::CREATE_REQUEST:
      return "CreateConferenceRequest";
    case MessageType::CREATE_RESPONSE:
      return "CreateConferenceResponse";
    case MessageType::JOIN_SALT_REQUEST:
      return "JoinSaltRequest";
    case MessageType::JOIN_SALT_RESPONSE:
      return "JoinSaltResponse";
    case MessageType::JOIN_REQUEST:
      return "JoinConferenceRequest";
    case MessageType::JOIN_RESPONSE:
      return "JoinConferenceResponse";
    case MessageType::LEAVE_NOTICE:
      return "LeaveConferenceNotice";
    case MessageType::PARTICIPANT_COUNT:
      return "ParticipantCount";
    case MessageType::CHAT:
      return "ChatMessage";
    case MessageType::HEARTBEAT:
      return "Heartbeat";
    case MessageType::DISCONNECT:
      return "Disconnect";
    case MessageType::ERROR:
      return "Error";
  }
  return "Unknown";
}

bool is_known_type(uint16_t type) {
  switch (static_cast<MessageType>(type)) {
    case MessageType::HELLO:
    case MessageType::HELLO_ACK:
    case MessageType::CREATE_REQUEST:
    case MessageType::CREATE_RESPONSE:
    case MessageType::JOIN_SALT_REQUEST:
    case MessageType::JOIN_SALT_RESPONSE:
    case MessageType::JOIN_REQUEST:
    case MessageType::JOIN_RESPONSE:
    case MessageType::LEAVE_NOTICE:
    case MessageType::PARTICIPANT_COUNT:
    case MessageType::CHAT:
    case MessageType::HEARTBEAT:
    case MessageType::DISCONNECT:
    case MessageType::ERROR:
      return true;
  }
  return false;
}
