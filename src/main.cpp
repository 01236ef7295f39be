// anonconf: anonymous group conferencing client.
#include "bcrypt.hpp"
#include "cli.hpp"
#include "conference.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "logger.hpp"
#include "session_state_machine.hpp"
#include "transport.hpp"
#include <csignal>
#include <iostream>
#include <memory>

int main(int argc, char* argv[]) {
  // Writes to a dead socket must fail with EPIPE instead of killing us.
  signal(SIGPIPE, SIG_IGN);

  ClientConfig cfg;
  std::string error;
  if (!parse_client_args(argc, argv, cfg, error)) {
    std::cerr << error << "\n";
    print_usage(argv[0]);
    return 1;
  }
  if (cfg.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (!cfg.log_level.empty()) {
    Logger::Level lvl;
    if (Logger::parse_level(cfg.log_level, lvl))
      Logger::set_level(lvl);
  }
  if (!cfg.log_file.empty() && !Logger::set_output_file(cfg.log_file)) {
    std::cerr << "cannot open log file " << cfg.log_file << "\n";
    return 1;
  }

  try {
    BcryptCredentials credentials(cfg.bcrypt_rounds);

    SessionOptions options;
    options.request_timeout = cfg.request_timeout;
    options.heartbeat_interval = cfg.heartbeat_interval;
    int connect_timeout_ms = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(cfg.request_timeout).count());

    SessionStateMachine machine(
        cfg.server, [connect_timeout_ms] { return std::unique_ptr<Transport>(new TcpTransport(connect_timeout_ms)); }, cfg.retry, options);
    MessageDispatcher dispatcher(machine);
    ConferenceController controller(machine, dispatcher, credentials);
    CliFrontend cli(controller, std::cin, std::cout);
    dispatcher.set_sink(&cli);
    machine.set_observer(&dispatcher);

    Logger::log(Logger::INFO, "starting, server " + cfg.server.to_string());
    SessionGuard running(machine);
    cli.run();
  } catch (const std::exception& e) {
    Logger::log(Logger::ERROR, std::string("fatal: ") + e.what());
    return 2;
  }
  return 0;
}
