#pragma once
// Client configuration, parsed from the command line.
//
// Options:
//   --server-address HOST:PORT   rendezvous server (default localhost:7667)
//   --cli                        terminal frontend (the only one built)
//   --verbose                    DEBUG logging
//   --log-level LEVEL            DEBUG | INFO | WARN | ERROR
//   --log-file PATH              append logs to PATH instead of stderr
//   --timeout SECONDS            create/join request deadline (default 10)
//   --bcrypt-rounds N            cost of new conference credentials (default 10)
//   --help                       usage
#include "retry.hpp"
#include "session.hpp"
#include <chrono>
#include <string>

struct ClientConfig {
  ServerAddress server;
  bool cli = true;
  bool show_help = false;
  std::string log_level; // empty: LOG_LEVEL env or INFO
  std::string log_file;  // empty: stderr
  std::chrono::seconds request_timeout{10};
  int bcrypt_rounds = 10;

  RetryPolicy retry;
  std::chrono::milliseconds heartbeat_interval{15000};
};

// Returns false with `error` set on an unknown option, a missing value or
// a malformed value. `cfg` keeps its defaults for options not given.
bool parse_client_args(int argc, const char* const* argv, ClientConfig& cfg, std::string& error);

void print_usage(const char* prog);
