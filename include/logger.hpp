#pragma once
#include <string>

// Logger: minimal, centralized logging utility.
// Usage: `Logger::log(Logger::INFO, "message");`
// Honors `LOG_LEVEL` env var: DEBUG, INFO, WARN, ERROR.
// Lines are serialized across threads; `set_file` additionally appends
// every line to a log file.
class Logger {
public:
  enum Level { DEBUG, INFO, WARN, ERROR };
  static void log(Level level, const std::string& msg);
  // Tee output to `path` (append). Returns false if the file can't be opened.
  static bool set_file(const std::string& path);
  // Helper to prefix messages with peer/player context.
  static std::string with_peer(const std::string& peer, const std::string& name, const std::string& msg);
};
