#pragma once
// Conference controller: the operations the presentation layer calls.
//
// create/join block the calling thread until the server answers or the
// request deadline passes; leave and send return immediately. Passwords
// are taken by value and wiped before returning; only the salted
// credential produced by the `CredentialScheme` is transmitted.
#include "credentials.hpp"
#include "dispatcher.hpp"
#include "errors.hpp"
#include "session_state_machine.hpp"
#include <string>

class ConferenceController {
  SessionStateMachine& machine;
  MessageDispatcher& dispatcher;
  CredentialScheme& credentials;

public:
  ConferenceController(SessionStateMachine& machine, MessageDispatcher& dispatcher, CredentialScheme& credentials);

  Result<ConferenceId, ConferenceError> create_conference(std::string password);
  Result<Pseudonym, ConferenceError> join_conference(ConferenceId id, std::string password);
  // Returns the id of the conference that was left.
  Result<ConferenceId, ConferenceError> leave_conference();
  Result<Message, SendError> send_message(const std::string& text);
};

ConferenceError admission_error(Admission admission);
// Error for a request that did not complete (REJECTED, TIMEOUT or CONNECTION_LOST).
ConferenceError outcome_error(const RequestOutcome& outcome);
