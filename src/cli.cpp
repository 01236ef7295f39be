#include "cli.hpp"
#include "crypto.hpp"
#include "util.hpp"
#include <istream>
#include <ostream>

static const char* HELP_TEXT = "Commands: /create <password>, /join <id> <password>, /leave, /exit; anything else is sent to the conference";

CliCommand parse_command(const std::string& line) {
  CliCommand cmd;
  std::string text = trim(line);
  if (text.empty())
    return cmd;
  if (text[0] != '/') {
    cmd.kind = CliCommand::Kind::SEND;
    cmd.text = text;
    return cmd;
  }

  std::vector<std::string> words = split_words(text);
  secure_wipe(text);
  const std::string& name = words[0];
  size_t arity = words.size() - 1;
  cmd.kind = CliCommand::Kind::INVALID;

  if (name == "/create") {
    if (arity != 1) {
      cmd.text = "usage: /create <password>";
    } else {
      cmd.kind = CliCommand::Kind::CREATE;
      cmd.password = words[1];
    }
  } else if (name == "/join") {
    if (arity != 2) {
      cmd.text = "usage: /join <id> <password>";
    } else if (!parse_u64(words[1], cmd.conference)) {
      cmd.text = "conference id must be a number";
    } else {
      cmd.kind = CliCommand::Kind::JOIN;
      cmd.password = words[2];
    }
  } else if (name == "/leave" || name == "/exit" || name == "/help") {
    if (arity != 0) {
      cmd.text = "usage: " + name;
    } else if (name == "/leave") {
      cmd.kind = CliCommand::Kind::LEAVE;
    } else if (name == "/exit") {
      cmd.kind = CliCommand::Kind::EXIT;
    } else {
      cmd.kind = CliCommand::Kind::HELP;
    }
  } else {
    cmd.text = "unknown command " + name;
  }

  for (std::string& word : words)
    secure_wipe(word);
  return cmd;
}

CliFrontend::CliFrontend(ConferenceController& controller, std::istream& in, std::ostream& out) : controller(controller), in(in), out(out) {}

void CliFrontend::print(const std::string& tag, const std::string& text) {
  std::lock_guard<std::mutex> lock(print_mutex);
  out << "[" << tag << "] " << text << std::endl;
}

bool CliFrontend::execute(CliCommand& cmd) {
  switch (cmd.kind) {
    case CliCommand::Kind::EMPTY:
      break;
    case CliCommand::Kind::INVALID:
      print("SYSTEM", cmd.text);
      break;
    case CliCommand::Kind::HELP:
      print("SYSTEM", HELP_TEXT);
      break;
    case CliCommand::Kind::EXIT:
      return false;
    case CliCommand::Kind::CREATE: {
      print("SYSTEM", "Creating conference...");
      auto result = controller.create_conference(std::move(cmd.password));
      if (result)
        print("SYSTEM", "Created conference " + std::to_string(result.value()));
      else
        print("SYSTEM", "Create failed: " + result.error().message());
      break;
    }
    case CliCommand::Kind::JOIN: {
      print("SYSTEM", "Joining conference " + std::to_string(cmd.conference) + "...");
      auto result = controller.join_conference(cmd.conference, std::move(cmd.password));
      if (result)
        print("SYSTEM", "Joined conference " + std::to_string(cmd.conference) + " as " + result.value());
      else
        print("SYSTEM", "Join failed: " + result.error().message());
      break;
    }
    case CliCommand::Kind::LEAVE: {
      auto result = controller.leave_conference();
      if (result)
        print("SYSTEM", "Left conference " + std::to_string(result.value()));
      else
        print("SYSTEM", "Leave failed: " + result.error().message());
      break;
    }
    case CliCommand::Kind::SEND: {
      auto result = controller.send_message(cmd.text);
      if (result)
        print("YOU", cmd.text);
      else
        print("SYSTEM", "Message not sent: " + result.error().message());
      break;
    }
  }
  return true;
}

void CliFrontend::run() {
  print("SYSTEM", HELP_TEXT);
  std::string line;
  while (std::getline(in, line)) {
    CliCommand cmd = parse_command(line);
    secure_wipe(line);
    if (!execute(cmd))
      break;
  }
  finished = true;
}

void CliFrontend::deliver(const Message& message) {
  print(message.sender, message.payload);
}

void CliFrontend::session_state_changed(SessionState previous, SessionState current) {
  if (finished)
    return;
  if (previous == SessionState::CONNECTING && current == SessionState::IDLE) {
    print("SYSTEM", "Connected to server");
  } else if (current == SessionState::DISCONNECTED && previous != SessionState::CONNECTING) {
    if (previous == SessionState::IN_CONFERENCE || previous == SessionState::LEAVING)
      print("SYSTEM", "Connection lost; you are no longer in the conference. Reconnecting...");
    else
      print("SYSTEM", "Connection lost. Reconnecting...");
  }
}

void CliFrontend::participants_changed(ConferenceId conference, uint32_t count) {
  print("SYSTEM", std::to_string(count) + (count == 1 ? " participant" : " participants") + " in conference " + std::to_string(conference));
}
