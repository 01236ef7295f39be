#include "dispatcher.hpp"
#include "logger.hpp"

MessageDispatcher::MessageDispatcher(SessionStateMachine& machine, PresentationSink* sink) : machine(machine), sink(sink) {}

void MessageDispatcher::set_sink(PresentationSink* s) {
  sink = s;
}

bool MessageDispatcher::record_delivery(ConferenceId conference, const Pseudonym& sender, uint64_t sequence) {
  std::lock_guard<std::mutex> lock(inbound_mutex);
  uint64_t& highest = highest_delivered[SenderKey(conference, sender)];
  if (sequence <= highest)
    return false;
  highest = sequence;
  return true;
}

Result<Message, SendError> MessageDispatcher::enqueue(const std::string& text) {
  std::lock_guard<std::mutex> lock(outbound_mutex);
  Session session = machine.snapshot();
  if (!session.in_conference())
    return SendError(SendError::Kind::NOT_IN_CONFERENCE);
  if (text.empty())
    return SendError(SendError::Kind::EMPTY_MESSAGE);
  if (text.size() > MAX_CHAT_TEXT)
    return SendError(SendError::Kind::MESSAGE_TOO_LONG);
  // sender: u16 len + bytes, sequence: u64, payload: u16 len + bytes
  if (2 + session.pseudonym.size() + 8 + 2 + text.size() > MAX_PAYLOAD_SIZE)
    return SendError(SendError::Kind::MESSAGE_TOO_LONG);

  ConferenceId conference = *session.conference;
  SenderKey key(conference, session.pseudonym);
  uint64_t sequence = last_sent[key] + 1;

  ChatMessage frame;
  frame.sender = session.pseudonym;
  frame.sequence = sequence;
  frame.payload = text;

  // Registered before sending: the echo may arrive before send_chat returns.
  record_delivery(conference, session.pseudonym, sequence);

  switch (machine.send_chat(conference, frame)) {
    case Admission::ACCEPTED:
      break;
    case Admission::NOT_CONNECTED:
      Logger::log(Logger::WARN, "chat message " + std::to_string(sequence) + " lost with the connection");
      return SendError(SendError::Kind::NOT_CONNECTED);
    default:
      return SendError(SendError::Kind::NOT_IN_CONFERENCE);
  }
  last_sent[key] = sequence;
  Logger::log(Logger::DEBUG, "sent chat message " + std::to_string(sequence) + " to conference " + std::to_string(conference));

  Message message;
  message.conference_id = conference;
  message.sender = session.pseudonym;
  message.sequence = sequence;
  message.payload = text;
  message.local_timestamp = std::chrono::system_clock::now();
  return message;
}

void MessageDispatcher::on_state_changed(SessionState previous, SessionState current) {
  if (previous == SessionState::IN_CONFERENCE && current != SessionState::IN_CONFERENCE) {
    std::lock_guard<std::mutex> lock(inbound_mutex);
    highest_delivered.clear();
  }
  if (sink)
    sink->session_state_changed(previous, current);
}

void MessageDispatcher::on_chat_message(ConferenceId conference, const ChatMessage& frame) {
  if (frame.sender.empty()) {
    Logger::log(Logger::WARN, "dropping chat message without a sender");
    return;
  }
  if (!record_delivery(conference, frame.sender, frame.sequence)) {
    Logger::log(Logger::DEBUG, "dropping duplicate message " + std::to_string(frame.sequence) + " from " + frame.sender);
    return;
  }
  Message message;
  message.conference_id = conference;
  message.sender = frame.sender;
  message.sequence = frame.sequence;
  message.payload = frame.payload;
  message.local_timestamp = std::chrono::system_clock::now();
  if (sink)
    sink->deliver(message);
}

void MessageDispatcher::on_participants_changed(ConferenceId conference, uint32_t count) {
  if (sink)
    sink->participants_changed(conference, count);
}
