#pragma once
// Terminal frontend.
//
// Reads commands line by line and prints session events:
//   /create <password>      create a conference
//   /join <id> <password>   join a conference
//   /leave                  leave the current conference
//   /exit                   quit (end of input does the same)
//   /help                   list commands
//   anything else           send to the current conference
// Output lines are tagged [SYSTEM], [YOU] or [<pseudonym>].
#include "conference.hpp"
#include "dispatcher.hpp"
#include <atomic>
#include <iosfwd>
#include <mutex>
#include <string>

struct CliCommand {
  enum class Kind { EMPTY, CREATE, JOIN, LEAVE, SEND, EXIT, HELP, INVALID };
  Kind kind = Kind::EMPTY;
  ConferenceId conference = 0;
  std::string password;
  std::string text; // SEND: message; INVALID: what is wrong
};

CliCommand parse_command(const std::string& line);

class CliFrontend : public PresentationSink {
  ConferenceController& controller;
  std::istream& in;
  std::ostream& out;
  std::mutex print_mutex;
  std::atomic<bool> finished{false};

  void print(const std::string& tag, const std::string& text);
  // Returns false when the user asked to quit.
  bool execute(CliCommand& cmd);

public:
  CliFrontend(ConferenceController& controller, std::istream& in, std::ostream& out);

  // Process input until /exit or end of input.
  void run();

  void deliver(const Message& message) override;
  void session_state_changed(SessionState previous, SessionState current) override;
  void participants_changed(ConferenceId conference, uint32_t count) override;
};
