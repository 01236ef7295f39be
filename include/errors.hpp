#pragma once
// Error values surfaced to the presentation layer.
//
// Every failed create/join/leave/send yields one of these; nothing fails
// silently. `Result<T, E>` carries either the value or the error.
#include <string>
#include <utility>
#include <variant>

struct ConferenceError {
  enum class Kind {
    NOT_CONNECTED,
    ALREADY_IN_CONFERENCE,
    NOT_IN_CONFERENCE,
    REQUEST_IN_PROGRESS,
    WRONG_PASSWORD,
    CONFERENCE_NOT_FOUND,
    TIMEOUT,
    SERVER_ERROR,
  };

  Kind kind;
  std::string reason; // SERVER_ERROR detail; empty otherwise

  ConferenceError(Kind k, std::string r = {}) : kind(k), reason(std::move(r)) {}
  std::string message() const;
};

struct SendError {
  enum class Kind { NOT_IN_CONFERENCE, EMPTY_MESSAGE, MESSAGE_TOO_LONG, NOT_CONNECTED };

  Kind kind;

  SendError(Kind k) : kind(k) {}
  std::string message() const;
};

template <typename T, typename E>
class Result {
  std::variant<T, E> data;

public:
  Result(T value) : data(std::in_place_index<0>, std::move(value)) {}
  Result(E error) : data(std::in_place_index<1>, std::move(error)) {}

  bool ok() const {
    return data.index() == 0;
  }
  explicit operator bool() const {
    return ok();
  }
  const T& value() const {
    return std::get<0>(data);
  }
  const E& error() const {
    return std::get<1>(data);
  }
};
