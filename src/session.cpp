#include "session.hpp"
#include "util.hpp"

std::string ServerAddress::to_string() const {
  if (host.find(':') != std::string::npos)
    return "[" + host + "]:" + std::to_string(port);
  return host + ":" + std::to_string(port);
}

bool ServerAddress::parse(const std::string& text, ServerAddress& out) {
  size_t colon = text.rfind(':');
  if (colon == std::string::npos || colon == 0)
    return false;

  std::string host = text.substr(0, colon);
  if (host.front() == '[') {
    if (host.size() < 3 || host.back() != ']')
      return false;
    host = host.substr(1, host.size() - 2);
  }

  uint64_t port = 0;
  if (!parse_u64(text.substr(colon + 1), port) || port == 0 || port > 65535)
    return false;

  out.host = host;
  out.port = static_cast<uint16_t>(port);
  return true;
}

const char* state_name(SessionState state) {
  switch (state) {
    case SessionState::DISCONNECTED:
      return "Disconnected";
    case SessionState::CONNECTING:
      return "Connecting";
    case SessionState::IDLE:
      return "Idle";
    case SessionState::AWAITING_CREATE:
      return "AwaitingCreate";
    case SessionState::AWAITING_JOIN:
      return "AwaitingJoin";
    case SessionState::IN_CONFERENCE:
      return "InConference";
    case SessionState::LEAVING:
      return "Leaving";
  }
  return "Unknown";
}
