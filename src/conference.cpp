#include "conference.hpp"
#include "crypto.hpp"
#include "logger.hpp"
#include <stdexcept>

ConferenceError admission_error(Admission admission) {
  switch (admission) {
    case Admission::NOT_CONNECTED:
      return ConferenceError(ConferenceError::Kind::NOT_CONNECTED);
    case Admission::REQUEST_IN_PROGRESS:
      return ConferenceError(ConferenceError::Kind::REQUEST_IN_PROGRESS);
    case Admission::ALREADY_IN_CONFERENCE:
      return ConferenceError(ConferenceError::Kind::ALREADY_IN_CONFERENCE);
    case Admission::NOT_IN_CONFERENCE:
      return ConferenceError(ConferenceError::Kind::NOT_IN_CONFERENCE);
    case Admission::ACCEPTED:
      break;
  }
  return ConferenceError(ConferenceError::Kind::SERVER_ERROR, "request was accepted");
}

ConferenceError outcome_error(const RequestOutcome& outcome) {
  switch (outcome.status) {
    case RequestStatus::REJECTED: {
      const ErrorResponse* err = std::get_if<ErrorResponse>(&outcome.response);
      if (!err)
        return ConferenceError(ConferenceError::Kind::SERVER_ERROR);
      if (err->code == ErrorCode::WRONG_PASSWORD)
        return ConferenceError(ConferenceError::Kind::WRONG_PASSWORD);
      if (err->code == ErrorCode::CONFERENCE_NOT_FOUND)
        return ConferenceError(ConferenceError::Kind::CONFERENCE_NOT_FOUND);
      return ConferenceError(ConferenceError::Kind::SERVER_ERROR, err->reason);
    }
    case RequestStatus::TIMEOUT:
      return ConferenceError(ConferenceError::Kind::TIMEOUT);
    case RequestStatus::CONNECTION_LOST:
      return ConferenceError(ConferenceError::Kind::SERVER_ERROR, "connection to server lost");
    default:
      break;
  }
  return ConferenceError(ConferenceError::Kind::SERVER_ERROR, "unexpected response");
}

ConferenceController::ConferenceController(SessionStateMachine& machine, MessageDispatcher& dispatcher, CredentialScheme& credentials)
    : machine(machine), dispatcher(dispatcher), credentials(credentials) {}

Result<ConferenceId, ConferenceError> ConferenceController::create_conference(std::string password) {
  // Reject before paying for the hash.
  Admission admission = machine.can_begin(RequestKind::CREATE);
  if (admission != Admission::ACCEPTED) {
    secure_wipe(password);
    return admission_error(admission);
  }

  std::string credential;
  Pseudonym pseudonym;
  try {
    credential = credentials.derive(password, credentials.generate_salt());
    pseudonym = random_pseudonym();
  } catch (const std::runtime_error& e) {
    secure_wipe(password);
    Logger::log(Logger::ERROR, std::string("create: ") + e.what());
    return ConferenceError(ConferenceError::Kind::SERVER_ERROR, e.what());
  }
  secure_wipe(password);

  uint64_t request_id = 0;
  admission = machine.begin_request(RequestKind::CREATE, CreateConferenceRequest{credential}, 0, pseudonym, request_id);
  secure_wipe(credential);
  if (admission != Admission::ACCEPTED)
    return admission_error(admission);

  RequestOutcome outcome = machine.await_response(request_id);
  if (outcome.status != RequestStatus::COMPLETED)
    return outcome_error(outcome);

  ConferenceId id = std::get<CreateConferenceResponse>(outcome.response).conference_id;
  Logger::log(Logger::INFO, "created conference " + std::to_string(id) + " as " + pseudonym);
  return id;
}

Result<Pseudonym, ConferenceError> ConferenceController::join_conference(ConferenceId id, std::string password) {
  uint64_t request_id = 0;
  Admission admission = machine.begin_request(RequestKind::JOIN_SALT, JoinSaltRequest{id}, id, Pseudonym(), request_id);
  if (admission != Admission::ACCEPTED) {
    secure_wipe(password);
    return admission_error(admission);
  }

  RequestOutcome outcome = machine.await_response(request_id);
  if (outcome.status != RequestStatus::COMPLETED) {
    secure_wipe(password);
    return outcome_error(outcome);
  }

  std::string credential;
  try {
    credential = credentials.derive(password, std::get<JoinSaltResponse>(outcome.response).salt);
  } catch (const std::runtime_error& e) {
    secure_wipe(password);
    machine.abandon_join();
    Logger::log(Logger::WARN, std::string("join: ") + e.what());
    return ConferenceError(ConferenceError::Kind::SERVER_ERROR, "server sent an unusable salt");
  }
  secure_wipe(password);

  admission = machine.begin_request(RequestKind::JOIN, JoinConferenceRequest{id, credential}, id, Pseudonym(), request_id);
  secure_wipe(credential);
  if (admission != Admission::ACCEPTED) {
    machine.abandon_join();
    return admission_error(admission);
  }

  outcome = machine.await_response(request_id);
  if (outcome.status != RequestStatus::COMPLETED)
    return outcome_error(outcome);

  Pseudonym pseudonym = std::get<JoinConferenceResponse>(outcome.response).pseudonym;
  Logger::log(Logger::INFO, "joined conference " + std::to_string(id) + " as " + pseudonym);
  return pseudonym;
}

Result<ConferenceId, ConferenceError> ConferenceController::leave_conference() {
  ConferenceId left = 0;
  Admission admission = machine.leave(left);
  if (admission != Admission::ACCEPTED)
    return admission_error(admission);
  return left;
}

Result<Message, SendError> ConferenceController::send_message(const std::string& text) {
  return dispatcher.enqueue(text);
}
