#include "logger.hpp"
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

static std::mutex log_mutex;
static std::ofstream log_file;

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
  std::string v(env);
  if (v == "DEBUG")
    return Logger::DEBUG;
  if (v == "INFO")
    return Logger::INFO;
  if (v == "WARN")
    return Logger::WARN;
  if (v == "ERROR")
    return Logger::ERROR;
  return Logger::INFO;
}

void Logger::log(Level level, const std::string& msg) {
  static Level min_level = runtime_level();
  if (level < min_level)
    return;
  auto now = std::chrono::system_clock::now();
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;
  std::tm tm{};
  localtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%F %T") << '.' << std::setw(6) << std::setfill('0') << micros << " [" << level_name(level) << "] " << msg;

  std::lock_guard<std::mutex> lock(log_mutex);
  std::cout << oss.str() << std::endl;
  if (log_file.is_open())
    log_file << oss.str() << std::endl;
}

bool Logger::set_file(const std::string& path) {
  std::lock_guard<std::mutex> lock(log_mutex);
  if (log_file.is_open())
    log_file.close();
  log_file.open(path, std::ios::out | std::ios::app);
  return log_file.is_open();
}

std::string Logger::with_peer(const std::string& peer, const std::string& name, const std::string& msg) {
  std::ostringstream oss;
  oss << "(" << peer;
  if (!name.empty())
    oss << ", " << name;
  oss << ") " << msg;
  return oss.str();
}
