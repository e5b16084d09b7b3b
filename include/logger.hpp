#pragma once
#include <cstdint>
#include <string>

// Logger: minimal, centralized logging utility.
// Usage: `Logger::log(Logger::INFO, "message");`
// Honors `LOG_LEVEL` env var: DEBUG, INFO, WARN, ERROR.
class Logger {
public:
  enum Level { DEBUG, INFO, WARN, ERROR };
  static void log(Level level, const std::string& msg);
  // Override the env-derived minimum level.
  static void set_level(Level level);
  // Parses DEBUG/INFO/WARN/ERROR; false for anything else.
  static bool parse_level(const std::string& name, Level& out);
  // Helper to prefix messages with topic/priority context.
  static std::string with_topic(const std::string& topic, uint8_t priority, const std::string& msg);
};
