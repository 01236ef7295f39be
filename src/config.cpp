#include "config.hpp"
#include "bcrypt.hpp"
#include "logger.hpp"
#include "util.hpp"
#include <cstring>
#include <iostream>

static bool takes_value(const char* arg) {
  static const char* const valued[] = {"--server-address", "--log-level", "--log-file", "--timeout", "--bcrypt-rounds"};
  for (const char* name : valued) {
    if (std::strcmp(arg, name) == 0)
      return true;
  }
  return false;
}

bool parse_client_args(int argc, const char* const* argv, ClientConfig& cfg, std::string& error) {
  for (int i = 1; i < argc; ++i) {
    const char* arg = argv[i];
    bool has_value = i + 1 < argc;

    if (std::strcmp(arg, "--cli") == 0) {
      cfg.cli = true;
    } else if (std::strcmp(arg, "--verbose") == 0) {
      cfg.log_level = "DEBUG";
    } else if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
      cfg.show_help = true;
    } else if (std::strcmp(arg, "--server-address") == 0 && has_value) {
      if (!ServerAddress::parse(argv[++i], cfg.server)) {
        error = std::string("invalid server address: ") + argv[i];
        return false;
      }
    } else if (std::strcmp(arg, "--log-level") == 0 && has_value) {
      Logger::Level lvl;
      if (!Logger::parse_level(argv[++i], lvl)) {
        error = std::string("invalid log level: ") + argv[i];
        return false;
      }
      cfg.log_level = argv[i];
    } else if (std::strcmp(arg, "--log-file") == 0 && has_value) {
      cfg.log_file = argv[++i];
      if (cfg.log_file.empty()) {
        error = "empty log file path";
        return false;
      }
    } else if (std::strcmp(arg, "--timeout") == 0 && has_value) {
      uint64_t secs = 0;
      if (!parse_u64(argv[++i], secs) || secs == 0 || secs > 3600) {
        error = std::string("invalid timeout (1..3600 seconds): ") + argv[i];
        return false;
      }
      cfg.request_timeout = std::chrono::seconds(secs);
    } else if (std::strcmp(arg, "--bcrypt-rounds") == 0 && has_value) {
      uint64_t rounds = 0;
      if (!parse_u64(argv[++i], rounds) || rounds < BCRYPT_MIN_ROUNDS || rounds > BCRYPT_MAX_ROUNDS) {
        error = std::string("invalid bcrypt rounds (4..31): ") + argv[i];
        return false;
      }
      cfg.bcrypt_rounds = static_cast<int>(rounds);
    } else if (takes_value(arg)) {
      error = std::string("missing value for ") + arg;
      return false;
    } else {
      error = std::string("unknown option: ") + arg;
      return false;
    }
  }
  return true;
}

void print_usage(const char* prog) {
  std::cerr << "Usage: " << prog << " [options]\n"
            << "\nOptions:\n"
            << "  --server-address HOST:PORT  rendezvous server (default: localhost:7667)\n"
            << "  --cli                       terminal frontend (default)\n"
            << "  --verbose                   enable debug logging\n"
            << "  --log-level LEVEL           DEBUG, INFO, WARN or ERROR (default: $LOG_LEVEL or INFO)\n"
            << "  --log-file PATH             append logs to PATH instead of stderr\n"
            << "  --timeout SECONDS           create/join deadline (default: 10)\n"
            << "  --bcrypt-rounds N           cost of new conference passwords, 4..31 (default: 10)\n"
            << "  --help                      show this message\n"
            << "\nCommands once running:\n"
            << "  /create <password>          create a conference\n"
            << "  /join <id> <password>       join a conference\n"
            << "  /leave                      leave the current conference\n"
            << "  /exit                       quit\n"
            << "  anything else               send to the current conference\n";
}
