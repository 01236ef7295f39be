#include "logger.hpp"
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace {
std::mutex log_mutex;
std::ofstream log_file;
bool level_overridden = false;
Logger::Level override_level = Logger::INFO;
} // namespace

static const char* level_name(Logger::Level lvl) {
  switch (lvl) {
    case Logger::DEBUG:
      return "DEBUG";
    case Logger::INFO:
      return "INFO";
    case Logger::WARN:
      return "WARN";
    case Logger::ERROR:
      return "ERROR";
  }
  return "INFO";
}

static Logger::Level runtime_level() {
  const char* env = std::getenv("LOG_LEVEL");
  if (!env)
    return Logger::INFO;
  Logger::Level lvl;
  if (Logger::parse_level(env, lvl))
    return lvl;
  return Logger::INFO;
}

bool Logger::parse_level(const std::string& v, Level& out) {
  if (v == "DEBUG") {
    out = DEBUG;
  } else if (v == "INFO") {
    out = INFO;
  } else if (v == "WARN") {
    out = WARN;
  } else if (v == "ERROR") {
    out = ERROR;
  } else {
    return false;
  }
  return true;
}

void Logger::set_level(Level level) {
  std::lock_guard<std::mutex> lock(log_mutex);
  override_level = level;
  level_overridden = true;
}

Logger::Level Logger::level() {
  static Level env_level = runtime_level();
  std::lock_guard<std::mutex> lock(log_mutex);
  return level_overridden ? override_level : env_level;
}

bool Logger::set_output_file(const std::string& path) {
  std::lock_guard<std::mutex> lock(log_mutex);
  if (log_file.is_open())
    log_file.close();
  log_file.open(path, std::ios::app);
  return log_file.is_open();
}

void Logger::log(Level level, const std::string& msg) {
  if (level < Logger::level())
    return;
  auto now = std::chrono::system_clock::now();
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  localtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%F %T") << " [" << level_name(level) << "] " << msg;

  std::lock_guard<std::mutex> lock(log_mutex);
  if (log_file.is_open()) {
    log_file << oss.str() << std::endl;
  } else {
    std::cerr << oss.str() << std::endl;
  }
}

std::string Logger::with_state(const char* state, const std::string& msg) {
  std::ostringstream oss;
  oss << "(state=" << state << ") " << msg;
  return oss.str();
}
