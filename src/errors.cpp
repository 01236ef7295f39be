#include "errors.hpp"

std::string ConferenceError::message() const {
  switch (kind) {
    case Kind::NOT_CONNECTED:
      return "not connected to the server";
    case Kind::ALREADY_IN_CONFERENCE:
      return "already in a conference; leave it first";
    case Kind::NOT_IN_CONFERENCE:
      return "not in a conference";
    case Kind::REQUEST_IN_PROGRESS:
      return "another request is still in progress";
    case Kind::WRONG_PASSWORD:
      return "wrong password";
    case Kind::CONFERENCE_NOT_FOUND:
      return "conference not found";
    case Kind::TIMEOUT:
      return "the server did not answer in time";
    case Kind::SERVER_ERROR:
      return reason.empty() ? "server error" : "server error: " + reason;
  }
  return "unknown error";
}

std::string SendError::message() const {
  switch (kind) {
    case Kind::NOT_IN_CONFERENCE:
      return "not in a conference";
    case Kind::EMPTY_MESSAGE:
      return "empty message";
    case Kind::MESSAGE_TOO_LONG:
      return "message too long";
    case Kind::NOT_CONNECTED:
      return "connection lost while sending";
  }
  return "unknown error";
}
