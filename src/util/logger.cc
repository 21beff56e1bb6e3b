#include "logger.h"
#include <mutex>
#include <algorithm>
#include <cctype>
#include <unistd.h>  // for write(), close()
#include <fcntl.h>   // for open()

namespace KiteLogger {

#ifdef KITE_DEBUG_BUILD
Level Logger::current_level_ = DEBUG;
#else
Level Logger::current_level_ = INFO;
#endif

static std::mutex log_mutex;
static int log_file_fd = -1;  // O_APPEND keeps concurrent writers' lines whole

static void CloseLogFileLocked() {
  if (log_file_fd >= 0) {
    close(log_file_fd);
    log_file_fd = -1;
  }
}

void Logger::Init() {
  std::lock_guard<std::mutex> lock(log_mutex);
  CloseLogFileLocked();
}

void Logger::Init(const std::string& log_file_path) {
  std::lock_guard<std::mutex> lock(log_mutex);
  CloseLogFileLocked();

  log_file_fd = open(log_file_path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
  if (log_file_fd < 0) {
    std::cerr << "[Logger] ERROR: Failed to open log file: " << log_file_path << std::endl;
  }
}

void Logger::SetLevel(Level level) {
  current_level_ = level;
}

Level Logger::GetLevel() {
  return current_level_;
}

bool Logger::ParseLevel(const std::string& name, Level& level) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "debug") { level = DEBUG; return true; }
  if (lower == "info") { level = INFO; return true; }
  if (lower == "warn" || lower == "warning") { level = WARN; return true; }
  if (lower == "error") { level = ERROR; return true; }
  return false;
}

std::string Logger::GetTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      now.time_since_epoch()) % 1000;
  auto timer = std::chrono::system_clock::to_time_t(now);
  std::tm bt;
  localtime_r(&timer, &bt);

  std::ostringstream oss;
  oss << std::put_time(&bt, "%H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

std::string Logger::LevelToString(Level level) {
  switch (level) {
    case DEBUG: return "DEBUG";
    case INFO:  return "INFO ";
    case WARN:  return "WARN ";
    case ERROR: return "ERROR";
    default:    return "UNKNOWN";
  }
}

void Logger::Log(Level level, const std::string& component, const std::string& message) {
  if (level < current_level_) {
    return;
  }

  std::string log_line = "[" + GetTimestamp() + "] " +
                         "[" + LevelToString(level) + "] " +
                         "[" + component + "] " +
                         message + "\n";

  std::lock_guard<std::mutex> lock(log_mutex);

  std::cerr << log_line;

  if (log_file_fd >= 0) {
    ssize_t bytes_written = write(log_file_fd, log_line.c_str(), log_line.length());
    (void)bytes_written;  // Logging must never fail the caller
  }
}

void Logger::Debug(const std::string& component, const std::string& message) {
  Log(DEBUG, component, message);
}

void Logger::Info(const std::string& component, const std::string& message) {
  Log(INFO, component, message);
}

void Logger::Warn(const std::string& component, const std::string& message) {
  Log(WARN, component, message);
}

void Logger::Error(const std::string& component, const std::string& message) {
  Log(ERROR, component, message);
}

} // namespace KiteLogger
