#include "session_state_machine.hpp"
#include "logger.hpp"
#include <utility>

using Clock = std::chrono::steady_clock;

SessionStateMachine::SessionStateMachine(const ServerAddress& address, TransportFactory factory, const RetryPolicy& retry_policy, const SessionOptions& options)
    : factory(std::move(factory)), retry(retry_policy), options(options) {
  session.server = address;
}

SessionStateMachine::~SessionStateMachine() {
  stop();
}

void SessionStateMachine::set_observer(SessionObserver* obs) {
  std::lock_guard<std::mutex> lock(mutex);
  observer = obs;
}

void SessionStateMachine::start() {
  std::lock_guard<std::mutex> lock(mutex);
  if (running)
    return;
  running = true;
  stopping = false;
  worker = std::thread(&SessionStateMachine::run, this);
}

void SessionStateMachine::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    if (!running)
      return;
    stopping = true;
    if (transport && !connection_dead) {
      if (session.connected) {
        std::string error;
        if (!transport->send(codec::encode(Disconnect{}), error))
          Logger::log(Logger::DEBUG, "disconnect notice not sent: " + error);
      }
      transport->close();
    }
    connection_dead = true;
    if (pending && pending->outcome.status == RequestStatus::PENDING) {
      pending->outcome.status = RequestStatus::CONNECTION_LOST;
    }
    cv.notify_all();
  }
  if (worker.joinable())
    worker.join();
  {
    std::lock_guard<std::mutex> lock(mutex);
    session.connected = false;
    session.clear_conference();
    set_state(SessionState::DISCONNECTED);
    running = false;
  }
  flush_events();
  Logger::log(Logger::INFO, "session stopped");
}

Session SessionStateMachine::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex);
  return session;
}

SessionState SessionStateMachine::state() const {
  std::lock_guard<std::mutex> lock(mutex);
  return session.state;
}

bool SessionStateMachine::wait_for_state(SessionState target, std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex);
  return cv.wait_for(lock, timeout, [&] { return session.state == target; });
}

// ---- worker ----

void SessionStateMachine::run() {
  const ServerAddress address = session.server;
  while (true) {
    {
      std::lock_guard<std::mutex> lock(mutex);
      if (stopping)
        break;
      set_state(SessionState::CONNECTING);
    }
    flush_events();

    std::string error;
    std::unique_ptr<Transport> fresh = factory();
    bool ok = fresh != nullptr;
    if (!ok)
      error = "no transport available";
    else
      ok = fresh->connect(address, error);

    Transport* active = nullptr;
    if (ok) {
      std::lock_guard<std::mutex> lock(mutex);
      if (stopping) {
        fresh->close();
        break;
      }
      transport = std::move(fresh);
      connection_dead = false;
      reader.clear();
      handshake_deadline = Clock::now() + options.request_timeout;
      active = transport.get();
      if (!send_frame(Hello{})) {
        ok = false;
        error = "handshake could not be sent";
      }
    }
    flush_events();

    if (ok)
      read_loop(active);

    std::unique_ptr<Transport> old;
    bool stop_now = false;
    {
      std::unique_lock<std::mutex> lock(mutex);
      old = std::move(transport);
      connection_dead = true;
      if (stopping) {
        stop_now = true;
      } else {
        if (!ok)
          Logger::log(Logger::WARN, "connect to " + address.to_string() + " failed: " + error);
        session.connected = false;
        set_state(SessionState::DISCONNECTED);

        auto delay = retry.next_delay(failed_attempts++);
        Logger::log(Logger::INFO, "reconnecting in " + std::to_string(delay.count()) + "ms (attempt " + std::to_string(failed_attempts) + ")");
        lock.unlock();
        flush_events();
        lock.lock();
        cv.wait_for(lock, delay, [this] { return stopping; });
        stop_now = stopping;
      }
    }
    old.reset();
    if (stop_now)
      break;
  }
}

void SessionStateMachine::read_loop(Transport* t) {
  std::vector<uint8_t> chunk;
  bool alive = true;
  while (alive) {
    chunk.clear();
    ReceiveStatus status = t->receive(chunk, options.poll_interval);
    {
      std::lock_guard<std::mutex> lock(mutex);
      if (stopping || connection_dead) {
        alive = false;
      } else if (status == ReceiveStatus::TIMEOUT) {
        on_tick(Clock::now());
      } else if (status == ReceiveStatus::CLOSED) {
        fail_connection("server closed the connection");
      } else if (status == ReceiveStatus::FAILED) {
        fail_connection("read failed");
      } else {
        reader.feed(chunk);
        ProtocolMessage frame;
        std::string error;
        codec::DecodeStatus ds = codec::DecodeStatus::INCOMPLETE;
        while (!connection_dead && (ds = reader.next(frame, error)) == codec::DecodeStatus::COMPLETE)
          handle_frame(frame);
        if (!connection_dead && ds == codec::DecodeStatus::MALFORMED) {
          Logger::log(Logger::ERROR, "malformed frame from server: " + error);
          fail_connection("malformed frame");
        }
        // A Hello exchange must finish even if the server keeps talking.
        if (!connection_dead)
          on_tick(Clock::now());
      }
      if (connection_dead)
        alive = false;
    }
    flush_events();
  }
}

void SessionStateMachine::on_tick(Clock::time_point now) {
  if (session.state == SessionState::CONNECTING && now >= handshake_deadline) {
    fail_connection("handshake timed out");
    return;
  }
  if (session.connected && now - last_send >= options.heartbeat_interval) {
    Logger::log(Logger::DEBUG, "sending heartbeat");
    send_frame(Heartbeat{});
  }
}

// ---- transitions (mutex held) ----

void SessionStateMachine::set_state(SessionState next) {
  if (next == session.state)
    return;
  SessionState previous = session.state;
  session.state = next;
  Logger::log(Logger::DEBUG, Logger::with_state(state_name(next), std::string("transition from ") + state_name(previous)));
  cv.notify_all();
  if (observer) {
    SessionObserver* obs = observer;
    events.push_back([obs, previous, next] { obs->on_state_changed(previous, next); });
  }
}

bool SessionStateMachine::send_frame(const ProtocolMessage& frame) {
  if (!transport || connection_dead)
    return false;
  std::string error;
  if (!transport->send(codec::encode(frame), error)) {
    fail_connection(std::string("write of ") + message_name(message_type(frame)) + " failed: " + error);
    return false;
  }
  last_send = Clock::now();
  return true;
}

void SessionStateMachine::fail_connection(const std::string& reason) {
  if (connection_dead)
    return;
  connection_dead = true;
  Logger::log(Logger::WARN, Logger::with_state(state_name(session.state), "connection lost: " + reason));
  if (transport)
    transport->close();
  session.connected = false;
  session.clear_conference();
  if (pending && pending->outcome.status == RequestStatus::PENDING)
    pending->outcome.status = RequestStatus::CONNECTION_LOST;
  set_state(SessionState::DISCONNECTED);
  cv.notify_all();
}

void SessionStateMachine::resolve(RequestStatus status, ProtocolMessage response) {
  pending->outcome.status = status;
  pending->outcome.response = std::move(response);
  cv.notify_all();
}

bool SessionStateMachine::pending_is(RequestKind kind) const {
  return pending && pending->kind == kind && pending->outcome.status == RequestStatus::PENDING;
}

Admission SessionStateMachine::admit(RequestKind kind) const {
  switch (session.state) {
    case SessionState::DISCONNECTED:
    case SessionState::CONNECTING:
      return Admission::NOT_CONNECTED;
    case SessionState::IN_CONFERENCE:
    case SessionState::LEAVING:
      return Admission::ALREADY_IN_CONFERENCE;
    default:
      break;
  }
  if (pending)
    return Admission::REQUEST_IN_PROGRESS;
  if (kind == RequestKind::JOIN) {
    if (session.state == SessionState::AWAITING_JOIN)
      return Admission::ACCEPTED;
    // The salt exchange belonged to a connection that has since been replaced.
    return Admission::NOT_CONNECTED;
  }
  if (session.state != SessionState::IDLE)
    return Admission::REQUEST_IN_PROGRESS;
  return Admission::ACCEPTED;
}

template <typename Frame>
void SessionStateMachine::on_frame(const Frame&) {
  Logger::log(Logger::WARN, std::string("ignoring unexpected ") + message_name(Frame::TYPE) + " from server");
}

void SessionStateMachine::handle_frame(const ProtocolMessage& frame) {
  Logger::log(Logger::DEBUG, Logger::with_state(state_name(session.state), std::string("received ") + message_name(message_type(frame))));
  std::visit([this](const auto& f) { on_frame(f); }, frame);
}

void SessionStateMachine::on_frame(const HelloAck& frame) {
  if (session.state != SessionState::CONNECTING) {
    Logger::log(Logger::WARN, "ignoring duplicate HelloAck");
    return;
  }
  if (frame.version != PROTOCOL_VERSION) {
    fail_connection("server speaks protocol version " + std::to_string(frame.version));
    return;
  }
  session.connected = true;
  failed_attempts = 0;
  Logger::log(Logger::INFO, "connected to " + session.server.to_string());
  set_state(SessionState::IDLE);
}

void SessionStateMachine::on_frame(const CreateConferenceResponse& frame) {
  if (!pending_is(RequestKind::CREATE) || session.state != SessionState::AWAITING_CREATE) {
    Logger::log(Logger::WARN, "dropping unmatched CreateConferenceResponse");
    return;
  }
  session.conference = frame.conference_id;
  session.pseudonym = pending->local_pseudonym;
  session.participants = 1;
  set_state(SessionState::IN_CONFERENCE);
  resolve(RequestStatus::COMPLETED, frame);
}

void SessionStateMachine::on_frame(const JoinSaltResponse& frame) {
  if (!pending_is(RequestKind::JOIN_SALT) || pending->conference != frame.conference_id) {
    Logger::log(Logger::WARN, "dropping unmatched JoinSaltResponse");
    return;
  }
  resolve(RequestStatus::COMPLETED, frame);
}

void SessionStateMachine::on_frame(const JoinConferenceResponse& frame) {
  if (!pending_is(RequestKind::JOIN) || session.state != SessionState::AWAITING_JOIN) {
    Logger::log(Logger::WARN, "dropping unmatched JoinConferenceResponse");
    return;
  }
  if (frame.pseudonym.empty()) {
    set_state(SessionState::IDLE);
    resolve(RequestStatus::REJECTED, ErrorResponse{ErrorCode::GENERAL, "server assigned an empty pseudonym"});
    return;
  }
  if (frame.pseudonym.size() > MAX_PSEUDONYM_SIZE) {
    Logger::log(Logger::WARN, "rejecting a " + std::to_string(frame.pseudonym.size()) + "-byte pseudonym");
    set_state(SessionState::IDLE);
    resolve(RequestStatus::REJECTED, ErrorResponse{ErrorCode::GENERAL, "server assigned an oversized pseudonym"});
    return;
  }
  session.conference = pending->conference;
  session.pseudonym = frame.pseudonym;
  session.participants = frame.participants;
  set_state(SessionState::IN_CONFERENCE);
  resolve(RequestStatus::COMPLETED, frame);
}

void SessionStateMachine::on_frame(const ParticipantCount& frame) {
  if (!session.in_conference()) {
    Logger::log(Logger::DEBUG, "ignoring participant count outside a conference");
    return;
  }
  session.participants = frame.count;
  if (observer) {
    SessionObserver* obs = observer;
    ConferenceId conference = *session.conference;
    uint32_t count = frame.count;
    events.push_back([obs, conference, count] { obs->on_participants_changed(conference, count); });
  }
}

void SessionStateMachine::on_frame(const ChatMessage& frame) {
  if (!session.in_conference()) {
    Logger::log(Logger::WARN, "dropping chat message received outside a conference");
    return;
  }
  if (observer) {
    SessionObserver* obs = observer;
    ConferenceId conference = *session.conference;
    events.push_back([obs, conference, frame] { obs->on_chat_message(conference, frame); });
  }
}

void SessionStateMachine::on_frame(const Heartbeat&) {
  // Traffic alone keeps the connection alive.
}

void SessionStateMachine::on_frame(const ErrorResponse& frame) {
  if (pending && pending->outcome.status == RequestStatus::PENDING) {
    Logger::log(Logger::INFO, Logger::with_state(state_name(session.state), "request rejected: " + frame.reason));
    set_state(SessionState::IDLE);
    resolve(RequestStatus::REJECTED, frame);
    return;
  }
  Logger::log(Logger::ERROR, "server error: " + frame.reason);
}

void SessionStateMachine::flush_events() {
  std::lock_guard<std::recursive_mutex> order(notify_mutex);
  std::vector<std::function<void()>> batch;
  {
    std::lock_guard<std::mutex> lock(mutex);
    batch.swap(events);
  }
  for (auto& event : batch)
    event();
}

// ---- caller operations ----

Admission SessionStateMachine::can_begin(RequestKind kind) const {
  std::lock_guard<std::mutex> lock(mutex);
  return admit(kind);
}

Admission SessionStateMachine::begin_request(RequestKind kind, const ProtocolMessage& frame, ConferenceId conference, const Pseudonym& local_pseudonym, uint64_t& request_id) {
  Admission admission;
  {
    std::lock_guard<std::mutex> lock(mutex);
    admission = admit(kind);
    if (admission == Admission::ACCEPTED) {
      PendingRequest request;
      request.id = next_request_id++;
      request.kind = kind;
      request.conference = conference;
      request.local_pseudonym = local_pseudonym;
      request.deadline = Clock::now() + options.request_timeout;
      pending = std::move(request);

      if (kind == RequestKind::CREATE)
        set_state(SessionState::AWAITING_CREATE);
      else if (kind == RequestKind::JOIN_SALT)
        set_state(SessionState::AWAITING_JOIN);

      if (send_frame(frame)) {
        request_id = pending->id;
      } else {
        pending.reset();
        admission = Admission::NOT_CONNECTED;
      }
    }
  }
  flush_events();
  return admission;
}

RequestOutcome SessionStateMachine::await_response(uint64_t request_id) {
  RequestOutcome outcome;
  {
    std::unique_lock<std::mutex> lock(mutex);
    if (!pending || pending->id != request_id) {
      outcome.status = RequestStatus::CONNECTION_LOST;
      return outcome;
    }
    cv.wait_until(lock, pending->deadline, [&] { return !pending || pending->id != request_id || pending->outcome.status != RequestStatus::PENDING; });
    if (!pending || pending->id != request_id) {
      outcome.status = RequestStatus::CONNECTION_LOST;
      return outcome;
    }
    if (pending->outcome.status == RequestStatus::PENDING) {
      Logger::log(Logger::WARN, Logger::with_state(state_name(session.state), "request timed out"));
      outcome.status = RequestStatus::TIMEOUT;
      if (session.state == SessionState::AWAITING_CREATE || session.state == SessionState::AWAITING_JOIN)
        set_state(SessionState::IDLE);
    } else {
      outcome = std::move(pending->outcome);
    }
    pending.reset();
  }
  flush_events();
  return outcome;
}

void SessionStateMachine::abandon_join() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    if (session.state == SessionState::AWAITING_JOIN && !pending)
      set_state(SessionState::IDLE);
  }
  flush_events();
}

Admission SessionStateMachine::leave(ConferenceId& left) {
  {
    std::lock_guard<std::mutex> lock(mutex);
    if (!session.in_conference())
      return Admission::NOT_IN_CONFERENCE;
    left = *session.conference;
    set_state(SessionState::LEAVING);
    // A failed write already moved the session to Disconnected.
    if (send_frame(LeaveConferenceNotice{})) {
      session.clear_conference();
      set_state(SessionState::IDLE);
    }
    Logger::log(Logger::INFO, "left conference " + std::to_string(left));
  }
  flush_events();
  return Admission::ACCEPTED;
}

Admission SessionStateMachine::send_chat(ConferenceId conference, const ChatMessage& message) {
  Admission admission = Admission::ACCEPTED;
  {
    std::lock_guard<std::mutex> lock(mutex);
    if (!session.in_conference() || *session.conference != conference || session.pseudonym != message.sender)
      admission = Admission::NOT_IN_CONFERENCE;
    else if (!send_frame(message))
      admission = Admission::NOT_CONNECTED;
  }
  flush_events();
  return admission;
}
