#pragma once
// Session data model shared by the core components.
//
// `Session` is written only by `SessionStateMachine`; everyone else reads
// a `Session` copy returned by `SessionStateMachine::snapshot()`.
#include "protocol.hpp"
#include <cstdint>
#include <optional>
#include <string>

// Rendezvous server endpoint; immutable for the life of a session.
struct ServerAddress {
  std::string host = "localhost";
  uint16_t port = 7667;

  std::string to_string() const;

  // Parse "host:port" (or "[v6addr]:port"). Returns false on a missing or
  // out-of-range port or an empty host.
  static bool parse(const std::string& text, ServerAddress& out);
};

enum class SessionState { DISCONNECTED, CONNECTING, IDLE, AWAITING_CREATE, AWAITING_JOIN, IN_CONFERENCE, LEAVING };

const char* state_name(SessionState state);

struct Session {
  ServerAddress server;
  SessionState state = SessionState::DISCONNECTED;
  bool connected = false;

  // Conference-scoped fields: set once on create/join, cleared on leave or disconnect.
  std::optional<ConferenceId> conference;
  Pseudonym pseudonym;
  uint32_t participants = 0;

  bool in_conference() const {
    return state == SessionState::IN_CONFERENCE && conference.has_value();
  }
  void clear_conference() {
    conference.reset();
    pseudonym.clear();
    participants = 0;
  }
};
