#pragma once
// Session state machine: the single writer of `Session`.
//
// Responsibilities:
// - Own the `Transport` and the worker thread that connects, performs the
//   Hello handshake, drains the read loop and reconnects with backoff
// - Validate user requests against the current state and emit their frames
// - Match responses to the single `PendingRequest` and apply the transition
// - Route chat and participant frames to the `SessionObserver`
//
// States:
//   Disconnected -> Connecting -> Idle -> {AwaitingCreate | AwaitingJoin}
//   -> InConference -> Leaving -> Idle; any state -> Disconnected on
//   transport failure.
//
// Concurrency:
// - All state lives behind one mutex; the read loop and caller threads
//   apply transitions under it.
// - Observer callbacks are queued under the mutex and run after it is
//   released, in order, on whichever thread produced them. Callbacks may
//   call back into the state machine.
#include "frame_codec.hpp"
#include "protocol.hpp"
#include "retry.hpp"
#include "session.hpp"
#include "transport.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

enum class RequestKind { CREATE, JOIN_SALT, JOIN };

enum class RequestStatus {
  PENDING,
  COMPLETED,       // success frame in `response`
  REJECTED,        // ErrorResponse in `response`
  TIMEOUT,         // deadline passed without an answer
  CONNECTION_LOST, // transport failed or the session stopped
};

struct RequestOutcome {
  RequestStatus status = RequestStatus::PENDING;
  ProtocolMessage response;
};

// Result of asking the state machine for a transition.
enum class Admission { ACCEPTED, NOT_CONNECTED, REQUEST_IN_PROGRESS, ALREADY_IN_CONFERENCE, NOT_IN_CONFERENCE };

struct PendingRequest {
  uint64_t id = 0;
  RequestKind kind = RequestKind::CREATE;
  ConferenceId conference = 0; // JOIN_SALT / JOIN target
  Pseudonym local_pseudonym;   // CREATE: the creator's own pseudonym
  std::chrono::steady_clock::time_point deadline;
  RequestOutcome outcome;
};

struct SessionOptions {
  std::chrono::milliseconds request_timeout{10000};
  std::chrono::milliseconds heartbeat_interval{15000};
  std::chrono::milliseconds poll_interval{200};
};

class SessionObserver {
public:
  virtual ~SessionObserver() = default;
  virtual void on_state_changed(SessionState previous, SessionState current) = 0;
  virtual void on_chat_message(ConferenceId conference, const ChatMessage& message) = 0;
  virtual void on_participants_changed(ConferenceId conference, uint32_t count) = 0;
};

class SessionStateMachine {
  mutable std::mutex mutex;
  mutable std::condition_variable cv;
  Session session;
  std::optional<PendingRequest> pending;
  uint64_t next_request_id = 1;

  TransportFactory factory;
  std::unique_ptr<Transport> transport; // created and destroyed only by the worker
  bool connection_dead = true;
  codec::FrameReader reader;

  RetryScheduler retry;
  unsigned failed_attempts = 0;
  SessionOptions options;
  std::chrono::steady_clock::time_point handshake_deadline;
  std::chrono::steady_clock::time_point last_send;

  SessionObserver* observer = nullptr;
  std::vector<std::function<void()>> events;
  std::recursive_mutex notify_mutex;

  std::thread worker;
  bool running = false;
  bool stopping = false;

  void run();
  void read_loop(Transport* t);
  void on_tick(std::chrono::steady_clock::time_point now);

  // Callers hold `mutex`.
  void set_state(SessionState next);
  bool send_frame(const ProtocolMessage& frame);
  void fail_connection(const std::string& reason);
  void resolve(RequestStatus status, ProtocolMessage response);
  bool pending_is(RequestKind kind) const;
  Admission admit(RequestKind kind) const;
  void handle_frame(const ProtocolMessage& frame);
  void on_frame(const HelloAck& frame);
  void on_frame(const CreateConferenceResponse& frame);
  void on_frame(const JoinSaltResponse& frame);
  void on_frame(const JoinConferenceResponse& frame);
  void on_frame(const ParticipantCount& frame);
  void on_frame(const ChatMessage& frame);
  void on_frame(const Heartbeat& frame);
  void on_frame(const ErrorResponse& frame);
  template <typename Frame>
  void on_frame(const Frame& frame);

  // Run queued observer callbacks. Callers must not hold `mutex`.
  void flush_events();

public:
  SessionStateMachine(const ServerAddress& address, TransportFactory factory, const RetryPolicy& retry_policy = RetryPolicy{},
                      const SessionOptions& options = SessionOptions{});
  ~SessionStateMachine();
  SessionStateMachine(const SessionStateMachine&) = delete;
  SessionStateMachine& operator=(const SessionStateMachine&) = delete;

  // Must be called before start().
  void set_observer(SessionObserver* obs);

  // Spawn the worker: connect, handshake, read, reconnect until stop().
  void start();
  // Send Disconnect (best effort), close the connection and join the worker.
  void stop();

  Session snapshot() const;
  SessionState state() const;
  // Block until the state equals `target` or `timeout` passes.
  bool wait_for_state(SessionState target, std::chrono::milliseconds timeout) const;

  // What begin_request(kind, ...) would answer right now; nothing is sent.
  Admission can_begin(RequestKind kind) const;

  // Open a PendingRequest and transmit `frame`.
  // CREATE and JOIN_SALT require Idle; JOIN requires AwaitingJoin after a
  // completed JOIN_SALT. Rejections leave the state untouched.
  Admission begin_request(RequestKind kind, const ProtocolMessage& frame, ConferenceId conference, const Pseudonym& local_pseudonym, uint64_t& request_id);

  // Wait for the answer to `request_id` or its deadline, whichever first.
  // On TIMEOUT and REJECTED the state is back to Idle when this returns.
  RequestOutcome await_response(uint64_t request_id);

  // Return from AwaitingJoin to Idle between the salt and join exchanges.
  void abandon_join();

  // InConference -> Leaving -> Idle. Sends LeaveConferenceNotice without
  // waiting for the server. `left` receives the conference id.
  Admission leave(ConferenceId& left);

  // Transmit a chat frame for `conference`, which must still be active and
  // owned by `message.sender`.
  Admission send_chat(ConferenceId conference, const ChatMessage& message);
};

// Starts `machine` and stops it when leaving scope, exceptions included.
// Declare it after the observers so the worker is joined before they die.
class SessionGuard {
  SessionStateMachine& machine;

public:
  explicit SessionGuard(SessionStateMachine& machine) : machine(machine) {
    machine.start();
  }
  ~SessionGuard() {
    machine.stop();
  }
  SessionGuard(const SessionGuard&) = delete;
  SessionGuard& operator=(const SessionGuard&) = delete;
};
