#pragma once
// Message dispatcher: chat traffic between the session and the presentation layer.
//
// Outbound: `enqueue()` stamps the next sequence number for the active
// (conference, own pseudonym) pair and hands the frame to the state machine.
// Inbound: chat frames are delivered in arrival order; a frame whose
// sequence number is not above the highest already delivered for its
// sender is a duplicate and is dropped. Own messages count as delivered,
// so the server echo of a sent message is dropped too.
#include "errors.hpp"
#include "protocol.hpp"
#include "session_state_machine.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>

struct Message {
  ConferenceId conference_id = 0;
  Pseudonym sender;
  uint64_t sequence = 0;
  std::string payload;
  std::chrono::system_clock::time_point local_timestamp;
};

// Receives one-way notifications; implementations must not block for long.
class PresentationSink {
public:
  virtual ~PresentationSink() = default;
  virtual void deliver(const Message& message) = 0;
  virtual void session_state_changed(SessionState previous, SessionState current) = 0;
  virtual void participants_changed(ConferenceId conference, uint32_t count) = 0;
};

class MessageDispatcher : public SessionObserver {
  using SenderKey = std::pair<ConferenceId, Pseudonym>;

  SessionStateMachine& machine;
  PresentationSink* sink;

  // Held across the send so sequence numbers hit the wire in order.
  std::mutex outbound_mutex;
  std::map<SenderKey, uint64_t> last_sent;

  // Never taken together with `outbound_mutex` from observer callbacks.
  std::mutex inbound_mutex;
  std::map<SenderKey, uint64_t> highest_delivered;

  // Returns false if the message is a duplicate.
  bool record_delivery(ConferenceId conference, const Pseudonym& sender, uint64_t sequence);

public:
  explicit MessageDispatcher(SessionStateMachine& machine, PresentationSink* sink = nullptr);

  void set_sink(PresentationSink* s);

  // Send `text` to the active conference. Fails without network traffic
  // when not in a conference or when `text` is empty or too long (on its
  // own, or together with the sender's pseudonym for one frame).
  Result<Message, SendError> enqueue(const std::string& text);

  void on_state_changed(SessionState previous, SessionState current) override;
  void on_chat_message(ConferenceId conference, const ChatMessage& message) override;
  void on_participants_changed(ConferenceId conference, uint32_t count) override;
};
