// ConferenceController tests: user operations end to end over the fake server.
#include <catch2/catch.hpp>

#include "conference.hpp"
#include "fake_server.hpp"

using namespace std::chrono_literals;

namespace {

const ConferenceId CONFERENCE = 8845684583ULL;

// Answers like a server holding CONFERENCE with password "hello".
std::vector<ProtocolMessage> rendezvous(const ProtocolMessage& m) {
  if (std::holds_alternative<CreateConferenceRequest>(m))
    return {CreateConferenceResponse{CONFERENCE}};
  if (const auto* salt = std::get_if<JoinSaltRequest>(&m)) {
    if (salt->conference_id != CONFERENCE)
      return {ErrorResponse{ErrorCode::CONFERENCE_NOT_FOUND, "conference not found"}};
    return {JoinSaltResponse{CONFERENCE, "stored-salt"}};
  }
  if (const auto* join = std::get_if<JoinConferenceRequest>(&m)) {
    if (join->password != "cred(hello|stored-salt)")
      return {ErrorResponse{ErrorCode::WRONG_PASSWORD, "wrong password"}};
    return {JoinConferenceResponse{"anon-joiner", 2}};
  }
  return {};
}

struct Client {
  RecordingSink sink;
  FakeCredentials credentials;
  SessionHarness h;
  MessageDispatcher dispatcher;
  ConferenceController controller;

  explicit Client(SessionOptions options = fast_options()) : h(options), dispatcher(h.machine, &sink), controller(h.machine, dispatcher, credentials) {
    h.machine.set_observer(&dispatcher);
    h.server->set_responder(rendezvous);
  }
  ~Client() {
    h.machine.stop();
  }
};

} // namespace

TEST_CASE("Creating a conference enters it; a second create is refused", "[conference][e2e]") {
  Client c;
  REQUIRE(c.h.start_idle());

  auto created = c.controller.create_conference("hello");
  REQUIRE(created.ok());
  REQUIRE(created.value() == CONFERENCE);
  REQUIRE(c.h.machine.state() == SessionState::IN_CONFERENCE);

  // Only the salted credential goes on the wire.
  REQUIRE(c.h.server->last<CreateConferenceRequest>().password == "cred(hello|salt-1)");

  Session s = c.h.machine.snapshot();
  REQUIRE(s.conference == CONFERENCE);
  REQUIRE(s.pseudonym.rfind("anon-", 0) == 0);
  REQUIRE(s.pseudonym.size() == 21);

  auto again = c.controller.create_conference("anything");
  REQUIRE_FALSE(again.ok());
  REQUIRE(again.error().kind == ConferenceError::Kind::ALREADY_IN_CONFERENCE);
  REQUIRE(c.h.server->count(MessageType::CREATE_REQUEST) == 1);

  auto join = c.controller.join_conference(CONFERENCE, "hello");
  REQUIRE(join.error().kind == ConferenceError::Kind::ALREADY_IN_CONFERENCE);
}

TEST_CASE("A sent message is numbered and its echo dropped", "[conference][e2e]") {
  Client c;
  REQUIRE(c.h.start_idle());
  REQUIRE(c.controller.create_conference("hello").ok());
  Pseudonym me = c.h.machine.snapshot().pseudonym;

  auto sent = c.controller.send_message("你好");
  REQUIRE(sent.ok());
  REQUIRE(sent.value().sequence == 1);

  REQUIRE(c.h.server->wait_for(MessageType::CHAT, 1, 1000ms));
  ChatMessage wire = c.h.server->last<ChatMessage>();
  REQUIRE(wire.sender == me);
  REQUIRE(wire.sequence == 1);
  REQUIRE(wire.payload == "你好");

  c.h.server->push(wire);
  c.h.server->push(ChatMessage{"anon-peer", 1, "marker"});
  REQUIRE(eventually([&] { return !c.sink.delivered().empty(); }));
  std::this_thread::sleep_for(50ms);
  auto delivered = c.sink.delivered();
  REQUIRE(delivered.size() == 1);
  REQUIRE(delivered[0].payload == "marker");
}

TEST_CASE("Joining with the wrong password fails and stays Idle", "[conference][e2e]") {
  Client c;
  REQUIRE(c.h.start_idle());

  auto joined = c.controller.join_conference(CONFERENCE, "wrong");
  REQUIRE_FALSE(joined.ok());
  REQUIRE(joined.error().kind == ConferenceError::Kind::WRONG_PASSWORD);
  REQUIRE(c.h.machine.state() == SessionState::IDLE);
  REQUIRE_FALSE(c.h.machine.snapshot().conference.has_value());
}

TEST_CASE("Joining with the right password yields the server's pseudonym", "[conference]") {
  Client c;
  REQUIRE(c.h.start_idle());

  auto joined = c.controller.join_conference(CONFERENCE, "hello");
  REQUIRE(joined.ok());
  REQUIRE(joined.value() == "anon-joiner");
  REQUIRE(c.h.server->last<JoinSaltRequest>().conference_id == CONFERENCE);
  REQUIRE(c.h.server->last<JoinConferenceRequest>().password == "cred(hello|stored-salt)");

  Session s = c.h.machine.snapshot();
  REQUIRE(s.state == SessionState::IN_CONFERENCE);
  REQUIRE(s.participants == 2);

  auto left = c.controller.leave_conference();
  REQUIRE(left.ok());
  REQUIRE(left.value() == CONFERENCE);
  REQUIRE(c.h.machine.state() == SessionState::IDLE);
}

TEST_CASE("Joining an unknown conference reports it", "[conference]") {
  Client c;
  REQUIRE(c.h.start_idle());

  auto joined = c.controller.join_conference(12345, "hello");
  REQUIRE(joined.error().kind == ConferenceError::Kind::CONFERENCE_NOT_FOUND);
  REQUIRE(c.h.server->count(MessageType::JOIN_REQUEST) == 0);
  REQUIRE(c.h.machine.state() == SessionState::IDLE);
}

TEST_CASE("Join times out when the server stays silent", "[conference][timeout]") {
  Client c(fast_options(150ms));
  REQUIRE(c.h.start_idle());
  c.h.server->set_responder([](const ProtocolMessage&) { return std::vector<ProtocolMessage>{}; });

  auto joined = c.controller.join_conference(CONFERENCE, "hello");
  REQUIRE(joined.error().kind == ConferenceError::Kind::TIMEOUT);
  REQUIRE(c.h.machine.state() == SessionState::IDLE);
}

TEST_CASE("An unusable salt aborts the join locally", "[conference]") {
  Client c;
  REQUIRE(c.h.start_idle());
  c.h.server->set_responder([](const ProtocolMessage& m) -> std::vector<ProtocolMessage> {
    if (std::holds_alternative<JoinSaltRequest>(m))
      return {JoinSaltResponse{CONFERENCE, "unusable"}};
    return {};
  });

  auto joined = c.controller.join_conference(CONFERENCE, "hello");
  REQUIRE(joined.error().kind == ConferenceError::Kind::SERVER_ERROR);
  REQUIRE(c.h.server->count(MessageType::JOIN_REQUEST) == 0);
  REQUIRE(c.h.machine.state() == SessionState::IDLE);
}

TEST_CASE("Operations are refused without a connection", "[conference][guards]") {
  Client c;
  REQUIRE(c.controller.create_conference("hello").error().kind == ConferenceError::Kind::NOT_CONNECTED);
  REQUIRE(c.controller.join_conference(CONFERENCE, "hello").error().kind == ConferenceError::Kind::NOT_CONNECTED);
  REQUIRE(c.controller.leave_conference().error().kind == ConferenceError::Kind::NOT_IN_CONFERENCE);
  REQUIRE(c.controller.send_message("hi").error().kind == SendError::Kind::NOT_IN_CONFERENCE);
}

TEST_CASE("Leaving and sending from Idle are usage errors", "[conference][guards]") {
  Client c;
  REQUIRE(c.h.start_idle());
  REQUIRE(c.controller.leave_conference().error().kind == ConferenceError::Kind::NOT_IN_CONFERENCE);
  REQUIRE(c.controller.send_message("hi").error().kind == SendError::Kind::NOT_IN_CONFERENCE);
  REQUIRE(c.h.server->count(MessageType::LEAVE_NOTICE) == 0);
}

TEST_CASE("A create interrupted by a dropped connection reports it", "[conference][reconnect]") {
  Client c;
  REQUIRE(c.h.start_idle());
  c.h.server->set_responder([](const ProtocolMessage&) { return std::vector<ProtocolMessage>{}; });

  std::thread breaker([&] {
    if (c.h.server->wait_for(MessageType::CREATE_REQUEST, 1, 2000ms))
      c.h.server->drop();
  });
  auto created = c.controller.create_conference("hello");
  breaker.join();

  REQUIRE_FALSE(created.ok());
  REQUIRE(created.error().kind == ConferenceError::Kind::SERVER_ERROR);
  REQUIRE(created.error().message() == "server error: connection to server lost");
  REQUIRE(c.h.machine.wait_for_state(SessionState::IDLE, 2000ms));
  REQUIRE_FALSE(c.h.machine.snapshot().conference.has_value());
}

TEST_CASE("Creating again after leaving uses a fresh pseudonym", "[conference]") {
  Client c;
  REQUIRE(c.h.start_idle());
  REQUIRE(c.controller.create_conference("hello").ok());
  Pseudonym first = c.h.machine.snapshot().pseudonym;
  REQUIRE(c.controller.leave_conference().ok());
  REQUIRE(c.controller.create_conference("hello").ok());
  REQUIRE(c.h.machine.snapshot().pseudonym != first);
  REQUIRE(c.h.server->last<CreateConferenceRequest>().password == "cred(hello|salt-2)");
}

TEST_CASE("An oversized pseudonym from the server fails the join, not the client", "[conference]") {
  Client c;
  REQUIRE(c.h.start_idle());
  c.h.server->set_responder([](const ProtocolMessage& m) -> std::vector<ProtocolMessage> {
    if (std::holds_alternative<JoinSaltRequest>(m))
      return {JoinSaltResponse{CONFERENCE, "stored-salt"}};
    if (std::holds_alternative<JoinConferenceRequest>(m))
      return {JoinConferenceResponse{std::string(3000, 'p'), 2}};
    return {};
  });

  auto joined = c.controller.join_conference(CONFERENCE, "hello");
  REQUIRE_FALSE(joined.ok());
  REQUIRE(joined.error().kind == ConferenceError::Kind::SERVER_ERROR);
  REQUIRE(c.h.machine.state() == SessionState::IDLE);

  auto sent = c.controller.send_message(std::string(2000, 'x'));
  REQUIRE_FALSE(sent.ok());
  REQUIRE(sent.error().kind == SendError::Kind::NOT_IN_CONFERENCE);
  REQUIRE(c.h.server->count(MessageType::CHAT) == 0);
}
