#ifndef KITE_LOGGER_H_
#define KITE_LOGGER_H_

#include <string>
#include <sstream>
#include <iostream>
#include <chrono>
#include <iomanip>

namespace KiteLogger {

enum Level {
  DEBUG,
  INFO,
  WARN,
  ERROR
};

class Logger {
public:
  static void Init();                                  // stderr only, closes any log file
  static void Init(const std::string& log_file_path);  // Also append every line to this file
  static void SetLevel(Level level);
  static Level GetLevel();

  // Accepts "debug", "info", "warn"/"warning", "error" (case-insensitive)
  static bool ParseLevel(const std::string& name, Level& level);

  static void Log(Level level, const std::string& component, const std::string& message);

  // Convenience methods
  static void Debug(const std::string& component, const std::string& message);
  static void Info(const std::string& component, const std::string& message);
  static void Warn(const std::string& component, const std::string& message);
  static void Error(const std::string& component, const std::string& message);

private:
  static Level current_level_;
  static std::string GetTimestamp();
  static std::string LevelToString(Level level);
};

} // namespace KiteLogger

// Convenience macros - LOG_DEBUG only compiles in debug builds
#ifdef KITE_DEBUG_BUILD
  #define LOG_DEBUG(component, msg) KiteLogger::Logger::Debug(component, msg)
#else
  #define LOG_DEBUG(component, msg) ((void)0)  // No-op in release builds
#endif

#define LOG_INFO(component, msg) KiteLogger::Logger::Info(component, msg)
#define LOG_WARN(component, msg) KiteLogger::Logger::Warn(component, msg)
#define LOG_ERROR(component, msg) KiteLogger::Logger::Error(component, msg)

#endif  // KITE_LOGGER_H_
