#include "logger.hpp"
#include "priority.hpp"
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

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
  Logger::Level level = Logger::INFO;
  if (env)
    Logger::parse_level(env, level);
  return level;
}

static std::atomic<int>& min_level() {
  static std::atomic<int> level{runtime_level()};
  return level;
}

bool Logger::parse_level(const std::string& name, Level& out) {
  if (name == "DEBUG")
    out = DEBUG;
  else if (name == "INFO")
    out = INFO;
  else if (name == "WARN")
    out = WARN;
  else if (name == "ERROR")
    out = ERROR;
  else
    return false;
  return true;
}

void Logger::set_level(Level level) {
  min_level().store(level);
}

void Logger::log(Level level, const std::string& msg) {
  if (level < min_level().load())
    return;
  auto now = std::chrono::system_clock::now();
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  localtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%F %T") << " [" << level_name(level) << "] " << msg;
  static std::mutex out_mutex;
  std::lock_guard<std::mutex> lock(out_mutex);
  std::cout << oss.str() << std::endl;
}

std::string Logger::with_topic(const std::string& topic, uint8_t priority, const std::string& msg) {
  std::ostringstream oss;
  oss << "(topic=" << topic << ", priority=" << priority_name(priority) << ") " << msg;
  return oss.str();
}
