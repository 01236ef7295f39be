#pragma once
#include <string>

// Logger: minimal, centralized logging utility.
// Usage: `Logger::log(Logger::INFO, "message");`
// Honors `LOG_LEVEL` env var: DEBUG, INFO, WARN, ERROR.
// Safe to call from the read loop and caller threads concurrently.
// Never pass passwords or password-derived credentials in `msg`.
class Logger {
public:
  enum Level { DEBUG, INFO, WARN, ERROR };
  static void log(Level level, const std::string& msg);

  // Override the level picked up from the environment (e.g. `--verbose`).
  static void set_level(Level level);
  static Level level();

  // Append to `path` instead of stderr. Returns false if the file cannot be opened.
  static bool set_output_file(const std::string& path);

  // Parse "DEBUG" / "INFO" / "WARN" / "ERROR". Returns false on anything else.
  static bool parse_level(const std::string& name, Level& out);

  // Helper to prefix messages with the session state.
  static std::string with_state(const char* state, const std::string& msg);
};
